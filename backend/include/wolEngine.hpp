#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "castDispatcher.hpp"
#include "deviceRegistry.hpp"
#include "engineConfig.hpp"
#include "livenessProber.hpp"
#include "macResolver.hpp"
#include "networkDiscovery.hpp"
#include "ouiTable.hpp"
#include "persistenceStore.hpp"
#include "targetSet.hpp"
#include "workerPool.hpp"

/**
 * Handle to a scan or cast running in the background
 * Copies refer to the same operation
 */
template<typename Summary>
class OperationHandle {
private:
    CancellationToken token;
    std::shared_future<Summary> result;

public:
    OperationHandle() = default;
    OperationHandle(const CancellationToken& token, std::shared_future<Summary> result)
        : token(token), result(std::move(result)) {}

    // Stops new dispatches; work already in flight completes
    void cancel() { token.cancel(); }

    /**
     * Blocks until the operation ends
     * @return: The final summary, partial if cancelled
     */
    Summary wait() const { return result.get(); }

    bool finished() const {
        return result.valid() && result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    bool valid() const { return result.valid(); }

    // Blocks until the operation ends without fetching the result
    void join() const {
        if (result.valid()) result.wait();
    }
};

/**
 * Scan event stream; each callback may be empty
 * Callbacks run on worker threads, one at a time
 */
struct ScanObserver {
    std::function<void(const Device&)> on_device;
    std::function<void(const ScanProgress&)> on_progress;
    std::function<void(const ScanSummary&)> on_summary;
};

struct CastObserver {
    std::function<void(const CastProgress&)> on_progress;
    std::function<void(const CastSummary&)> on_summary;
};

/**
 * Everything one engine instance owns and mutates
 */
struct EngineState {
    DeviceRegistry registry;

    std::mutex targets_mutex;
    TargetSet targets;

    // Interface name -> CIDR of every subnet scanned so far
    std::map<std::string, std::string> subnets;
};

/**
 * WolEngine is the API consumed by the command-line driver
 *
 * Owns the device registry, the target set and the persistence store. At
 * most one scan and one cast run at a time; a second start request of the
 * same kind fails with OperationInProgressError. Instances are independent
 * of each other.
 */
class WolEngine {
private:
    EngineConfig config;
    PersistenceStore store;
    std::mutex store_mutex;     // Scan and import may autosave at the same time
    OuiTable vendors;

    std::shared_ptr<LivenessProber> prober;
    std::shared_ptr<MacResolver> resolver;
    std::shared_ptr<CastDispatcher> dispatcher;

    EngineState state;

    std::atomic<bool> scan_active{false};
    std::atomic<bool> cast_active{false};

    std::mutex operations_mutex;
    OperationHandle<ScanSummary> current_scan;
    OperationHandle<CastSummary> current_cast;

    PersistedState snapshotState();
    void autosave();

public:
    explicit WolEngine(const EngineConfig& config = EngineConfig());

    /**
     * Builds an engine around explicit network seams
     * @param prober, resolver, dispatcher: Replace the default socket based
     *                                      implementations; null keeps the default
     */
    WolEngine(const EngineConfig& config, std::shared_ptr<LivenessProber> prober,
              std::shared_ptr<MacResolver> resolver, std::shared_ptr<CastDispatcher> dispatcher);

    // Cancels and waits for any running scan or cast
    ~WolEngine();

    WolEngine(const WolEngine&) = delete;
    WolEngine& operator=(const WolEngine&) = delete;

    const EngineConfig& getConfig() const { return config; }

    std::vector<NetworkInterface> listInterfaces() const;

    /**
     * Starts a scan in the background
     * @param interfaces: Interfaces whose subnets are swept
     * @param observer: Device update, progress and summary callbacks
     * @param concurrency: Worker count; 0 uses scan.concurrency
     * Throws OperationInProgressError if a scan is running, and
     * InvalidInterfaceError before anything starts if an interface is invalid
     */
    OperationHandle<ScanSummary> startScan(const std::vector<NetworkInterface>& interfaces,
                                           const ScanObserver& observer = ScanObserver(),
                                           size_t concurrency = 0);

    /**
     * Starts a cast in the background
     * @param targets: Output of resolveTargets(); sent as given
     * @param port: UDP port; 0 uses cast.port
     * @param concurrency: Worker count; 0 uses cast.concurrency
     * Throws OperationInProgressError if a cast is running
     */
    OperationHandle<CastSummary> startCast(const std::vector<ResolvedTarget>& targets,
                                           const CastObserver& observer = CastObserver(),
                                           uint16_t port = 0, size_t concurrency = 0);

    // Requests cancellation of whatever scan and cast are running
    void cancel();

    bool scanInProgress() const { return scan_active.load(); }
    bool castInProgress() const { return cast_active.load(); }

    // Current device set, ordered by interface then address
    std::vector<Device> getRegistry() const;

    bool addTarget(const TargetSelection& selection);
    bool removeTarget(const TargetSelection& selection);
    void clearTargets();
    std::vector<TargetSelection> getTargets();
    ResolutionReport resolveTargets();

    /**
     * Merges the persisted state into memory
     * Devices already in the registry win over their persisted copies and
     * persisted selections are unioned into the target set
     * @return: false if the state file was corrupt and nothing was loaded
     */
    bool load();

    // Throws StorageError
    void save();

    // Throws StorageError
    void exportTo(const std::string& path, ExportFormat format);

    /**
     * Merges a JSON export into the registry and target set
     * Records are upserted per key, so devices a running scan adds are kept
     * Throws ImportFormatError, leaving the state untouched
     */
    ImportSummary importFrom(const std::string& path);

    // Empties the registry and target set and deletes the state file
    void clearHistory();
};
