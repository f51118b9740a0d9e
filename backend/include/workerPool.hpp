#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

/**
 * Cooperative, monotonic cancellation flag
 * Copies share the same flag; a fresh token is created per scan/cast
 */
class CancellationToken {
private:
    std::shared_ptr<std::atomic<bool>> cancelled;

public:
    CancellationToken() : cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    // Once requested, stays requested
    void cancel() { cancelled->store(true); }

    bool isCancelled() const { return cancelled->load(); }
};

/**
 * Runs work items pulled from a generator on a bounded set of threads
 *
 * Each worker takes the next item under a lock, checking the cancellation
 * token first, so no item is dispatched after cancel() while items already
 * taken run to completion. One slow item only occupies its own worker.
 *
 * @param workers: Maximum number of concurrently running items
 * @param token: Checked before every dispatch
 * @param next: Returns the next item, or std::nullopt when the source is exhausted
 * @param work: Processes one item; must not throw
 * @return: Number of items dispatched
 */
template<typename Item>
size_t runBounded(size_t workers, const CancellationToken& token,
                  std::function<std::optional<Item>()> next,
                  std::function<void(const Item&)> work) {
    std::mutex source_mutex;
    size_t dispatched = 0;

    auto worker = [&]() {
        while (true) {
            std::optional<Item> item;
            {
                std::lock_guard<std::mutex> lock(source_mutex);
                if (token.isCancelled()) return;
                item = next();
                if (!item) return;
                dispatched++;
            }
            work(*item);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(std::max<size_t>(workers, 1));
    for (size_t i = 0; i < std::max<size_t>(workers, 1); i++) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return dispatched;
}
