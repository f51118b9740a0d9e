#pragma once

#include <chrono>
#include <cstdint>
#include <functional>  // For callback functions
#include <string>
#include <vector>
#include "magicPacket.hpp"
#include "targetSet.hpp"
#include "workerPool.hpp"

struct CastSettings {
    uint16_t port = WOL_DEFAULT_PORT;
    size_t concurrency = 32;

    // Send to the subnet broadcast address instead of the target IP when known
    bool directed_broadcast = false;
};

/**
 * Progress after one send completed, in completion order
 */
struct CastProgress {
    ResolvedTarget target;
    bool sent;              // false if this send failed
    size_t completed;       // Sends finished so far, failed ones included
    size_t total;
};

struct CastFailure {
    ResolvedTarget target;
    std::string reason;
};

/**
 * Final tally of a cast; produced on completion and on cancellation
 */
struct CastSummary {
    size_t total = 0;
    size_t sent = 0;
    size_t failed = 0;
    std::vector<CastFailure> failures;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};

    // Targets never dispatched because of cancellation
    size_t skipped() const { return total - sent - failed; }
};

/**
 * CastDispatcher sends one magic packet datagram per resolved target
 *
 * Sends run on a bounded set of workers so a large cast does not hit the
 * link all at once. A failed send is recorded in the summary and never
 * stops the batch. Cancellation stops new dispatches only.
 */
class CastDispatcher {
private:
    CastSettings settings;

    // Callback for progress updates (using std::function for flexibility)
    std::function<void(const CastProgress&)> progress_callback;

protected:
    /**
     * Sends payload as one UDP datagram
     * @param destination: Dotted-quad unicast or broadcast address
     * @param payload: Encoded magic packet
     * @param port: UDP destination port
     * @param error: Receives the failure reason
     * @return: true if the datagram was handed to the kernel
     */
    virtual bool sendPacket(const std::string& destination, const std::vector<uint8_t>& payload,
                            uint16_t port, std::string& error);

public:
    explicit CastDispatcher(const CastSettings& settings = CastSettings());
    virtual ~CastDispatcher() = default;

    /**
     * Casts to every target, in any order
     * @param targets: Output of TargetSet::resolve(); duplicates are sent twice
     * @param token: Checked before every dispatch
     * @return: Summary with sent/failed counts and a reason per failure
     */
    CastSummary cast(const std::vector<ResolvedTarget>& targets, const CancellationToken& token);

    /**
     * Sets a callback function to receive progress updates
     * Invoked from worker threads, one call at a time
     */
    void setProgressCallback(std::function<void(const CastProgress&)> callback) {
        progress_callback = callback;
    }

    const CastSettings& getSettings() const { return settings; }

    // Must not be called while a cast is running
    void setSettings(const CastSettings& new_settings) { settings = new_settings; }
};
