#include "wolEngine.hpp"
#include "addressSpace.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <exception>
#include <system_error>

namespace {

// Clears an in-progress flag when the background task ends, however it ends
class ActiveFlag {
private:
    std::atomic<bool>& flag;

public:
    explicit ActiveFlag(std::atomic<bool>& flag) : flag(flag) {}
    ~ActiveFlag() { flag.store(false); }
};

OuiTable loadVendors(const EngineConfig& config) {
    if (config.oui_database.empty()) {
        return OuiTable::builtin();
    }
    return OuiTable::load(config.oui_database);
}

}

WolEngine::WolEngine(const EngineConfig& config)
    : WolEngine(config, nullptr, nullptr, nullptr) {}

WolEngine::WolEngine(const EngineConfig& config, std::shared_ptr<LivenessProber> prober,
                     std::shared_ptr<MacResolver> resolver, std::shared_ptr<CastDispatcher> dispatcher)
    : config(config),
      store(config.statePath()),
      vendors(loadVendors(config)),
      prober(prober ? prober : std::make_shared<LivenessProber>(config.probe)),
      resolver(resolver ? resolver : std::make_shared<MacResolver>(config.arp_wait_ms)),
      dispatcher(dispatcher ? dispatcher : std::make_shared<CastDispatcher>(config.cast)) {
    LOG_DEBUG("Engine state at ", store.getStatePath(), ", ", vendors.size(), " OUI entries");
}

WolEngine::~WolEngine() {
    cancel();

    std::lock_guard<std::mutex> lock(operations_mutex);
    current_scan.join();
    current_cast.join();
}

std::vector<NetworkInterface> WolEngine::listInterfaces() const {
    return ::listInterfaces();
}

OperationHandle<ScanSummary> WolEngine::startScan(const std::vector<NetworkInterface>& interfaces,
                                                  const ScanObserver& observer, size_t concurrency) {
    // Reject malformed interfaces before claiming the scan slot
    std::map<std::string, std::string> scanned;
    for (const auto& iface : interfaces) {
        AddressRange range(iface);
        scanned[iface.name] = range.cidr();
    }

    bool expected = false;
    if (!scan_active.compare_exchange_strong(expected, true)) {
        throw OperationInProgressError("a scan is already running");
    }

    {
        std::lock_guard<std::mutex> lock(state.targets_mutex);
        for (const auto& entry : scanned) {
            state.subnets[entry.first] = entry.second;
        }
    }

    ScanOptions options = config.scan;
    if (concurrency > 0) options.concurrency = concurrency;

    CancellationToken token;
    auto task = [this, interfaces, observer, options, token]() -> ScanSummary {
        ActiveFlag active(scan_active);

        NetworkDiscovery discovery(*prober, *resolver, vendors, options);
        discovery.setDeviceFoundCallback([this, &observer](const Device& device) {
            state.registry.upsertObservation(device, config.record_offline_hosts);
            if (observer.on_device) observer.on_device(device);
        });
        discovery.setProgressCallback([&observer](const ScanProgress& progress) {
            if (observer.on_progress) observer.on_progress(progress);
        });

        ScanSummary summary = discovery.scan(interfaces, token);
        autosave();

        if (observer.on_summary) {
            try {
                observer.on_summary(summary);
            } catch (const std::exception& e) {
                LOG_WARNING("Scan observer raised: ", e.what());
            }
        }
        return summary;
    };

    OperationHandle<ScanSummary> handle;
    try {
        handle = OperationHandle<ScanSummary>(token, std::async(std::launch::async, task).share());
    } catch (const std::system_error&) {
        scan_active.store(false);
        throw;
    }

    std::lock_guard<std::mutex> lock(operations_mutex);
    current_scan = handle;
    return handle;
}

OperationHandle<CastSummary> WolEngine::startCast(const std::vector<ResolvedTarget>& targets,
                                                  const CastObserver& observer, uint16_t port,
                                                  size_t concurrency) {
    bool expected = false;
    if (!cast_active.compare_exchange_strong(expected, true)) {
        throw OperationInProgressError("a cast is already running");
    }

    CastSettings settings = config.cast;
    if (port > 0) settings.port = port;
    if (concurrency > 0) settings.concurrency = concurrency;
    dispatcher->setSettings(settings);

    CancellationToken token;
    auto task = [this, targets, observer, token]() -> CastSummary {
        ActiveFlag active(cast_active);

        dispatcher->setProgressCallback([&observer](const CastProgress& progress) {
            if (observer.on_progress) observer.on_progress(progress);
        });
        CastSummary summary = dispatcher->cast(targets, token);
        dispatcher->setProgressCallback(nullptr);

        if (observer.on_summary) {
            try {
                observer.on_summary(summary);
            } catch (const std::exception& e) {
                LOG_WARNING("Cast observer raised: ", e.what());
            }
        }
        return summary;
    };

    OperationHandle<CastSummary> handle;
    try {
        handle = OperationHandle<CastSummary>(token, std::async(std::launch::async, task).share());
    } catch (const std::system_error&) {
        cast_active.store(false);
        throw;
    }

    std::lock_guard<std::mutex> lock(operations_mutex);
    current_cast = handle;
    return handle;
}

void WolEngine::cancel() {
    std::lock_guard<std::mutex> lock(operations_mutex);
    current_scan.cancel();
    current_cast.cancel();
}

std::vector<Device> WolEngine::getRegistry() const {
    return state.registry.snapshot();
}

bool WolEngine::addTarget(const TargetSelection& selection) {
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    return state.targets.add(selection);
}

bool WolEngine::removeTarget(const TargetSelection& selection) {
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    return state.targets.remove(selection);
}

void WolEngine::clearTargets() {
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    state.targets.clear();
}

std::vector<TargetSelection> WolEngine::getTargets() {
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    return state.targets.getSelections();
}

ResolutionReport WolEngine::resolveTargets() {
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    return state.targets.resolve(state.registry, state.subnets);
}

PersistedState WolEngine::snapshotState() {
    PersistedState snapshot;
    snapshot.interfaces = state.registry.byInterface();
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    snapshot.targets = state.targets;
    return snapshot;
}

void WolEngine::autosave() {
    if (!config.autosave) return;
    try {
        std::lock_guard<std::mutex> lock(store_mutex);
        store.save(snapshotState());
    } catch (const StorageError& e) {
        LOG_WARNING("Autosave failed: ", e.what());
    }
}

bool WolEngine::load() {
    PersistedState loaded;
    bool intact = true;
    try {
        std::lock_guard<std::mutex> lock(store_mutex);
        loaded = store.load();
    } catch (const CorruptStateError& e) {
        LOG_WARNING(e.what(), "; ignoring the state file");
        intact = false;
    }

    // Merge rather than replace, so results of a running scan survive
    state.registry.restore(loaded.interfaces);
    std::lock_guard<std::mutex> lock(state.targets_mutex);
    for (const auto& selection : loaded.targets.getSelections()) {
        state.targets.add(selection);
    }
    return intact;
}

void WolEngine::save() {
    std::lock_guard<std::mutex> lock(store_mutex);
    store.save(snapshotState());
}

void WolEngine::exportTo(const std::string& path, ExportFormat format) {
    store.exportTo(snapshotState(), path, format);
}

ImportSummary WolEngine::importFrom(const std::string& path) {
    ImportDocument document = store.readImport(path);

    ImportSummary summary;
    summary.devices_read = document.devices.size();
    summary.targets_read = document.targets.size();

    // Per-key upserts under the registry lock; a concurrent scan keeps its devices
    DeviceRegistry::MergeCounts counts = state.registry.mergeRecords(document.devices);
    summary.devices_added = counts.added;
    summary.devices_updated = counts.updated;
    {
        std::lock_guard<std::mutex> lock(state.targets_mutex);
        for (const auto& selection : document.targets) {
            if (state.targets.add(selection)) summary.targets_added++;
        }
    }

    LOG_INFO("Imported ", path, ": ", summary.devices_added, " devices added, ",
             summary.devices_updated, " updated, ", summary.targets_added, " targets added");
    autosave();
    return summary;
}

void WolEngine::clearHistory() {
    state.registry.clear();
    {
        std::lock_guard<std::mutex> lock(state.targets_mutex);
        state.targets.clear();
    }
    {
        std::lock_guard<std::mutex> lock(store_mutex);
        store.erase();
    }
    LOG_INFO("Device history cleared");
}
