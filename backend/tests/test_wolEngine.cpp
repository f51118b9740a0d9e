#include <catch2/catch.hpp>

#include <algorithm>
#include "errors.hpp"
#include "testSupport.hpp"
#include "wolEngine.hpp"

namespace {

const NetworkInterface LAB{"lab0", "10.1.0.1", "255.255.255.248"};     // .1 - .6

struct Rig {
    TempDir dir;
    EngineConfig config;
    std::shared_ptr<FakeProber> prober = std::make_shared<FakeProber>();
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    std::shared_ptr<FakeDispatcher> dispatcher = std::make_shared<FakeDispatcher>();

    Rig() {
        config.data_dir = dir.str();
        prober->setOnline("10.1.0.2");
        prober->setStandby("10.1.0.3");
        resolver->neighbors["10.1.0.2"] = parseMac("00:50:56:00:00:02");
        resolver->neighbors["10.1.0.3"] = parseMac("52:54:00:00:00:03");
    }

    std::unique_ptr<WolEngine> engine() {
        return std::make_unique<WolEngine>(config, prober, resolver, dispatcher);
    }
};

}

TEST_CASE("Scan fills the registry and reports every address") {
    Rig rig;
    auto engine = rig.engine();

    std::atomic<size_t> updates{0};
    std::atomic<size_t> summaries{0};
    ScanObserver observer;
    observer.on_device = [&](const Device&) { updates++; };
    observer.on_summary = [&](const ScanSummary&) { summaries++; };

    OperationHandle<ScanSummary> handle = engine->startScan({LAB}, observer);
    ScanSummary summary = handle.wait();

    REQUIRE(handle.finished());
    REQUIRE(summary.total == 6);
    REQUIRE(summary.completed == 6);
    REQUIRE(summary.online == 1);
    REQUIRE(summary.standby == 1);
    REQUIRE(updates.load() == 6);
    REQUIRE(summaries.load() == 1);
    REQUIRE_FALSE(engine->scanInProgress());

    std::vector<Device> devices = engine->getRegistry();
    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].ip_address == "10.1.0.2");
    REQUIRE(devices[0].vendor == std::string("VMware"));
    REQUIRE(devices[1].status == DeviceStatus::Standby);

    // Autosave wrote the scan results
    REQUIRE(std::filesystem::exists(rig.config.statePath()));
}

TEST_CASE("Recording offline hosts is opt-in") {
    Rig rig;
    rig.config.record_offline_hosts = true;
    auto engine = rig.engine();

    engine->startScan({LAB}).wait();
    REQUIRE(engine->getRegistry().size() == 6);
}

TEST_CASE("Only one scan runs at a time") {
    Rig rig;
    rig.prober->latency = std::chrono::milliseconds(50);
    auto engine = rig.engine();

    OperationHandle<ScanSummary> first = engine->startScan({LAB}, ScanObserver(), 1);
    REQUIRE(engine->scanInProgress());
    REQUIRE_THROWS_AS(engine->startScan({LAB}), OperationInProgressError);

    // A cast may overlap a scan
    OperationHandle<CastSummary> cast = engine->startCast({});
    cast.wait();

    first.cancel();
    ScanSummary summary = first.wait();
    REQUIRE(summary.cancelled);
    REQUIRE(summary.completed < summary.total);

    REQUIRE_NOTHROW(engine->startScan({LAB}).wait());
}

TEST_CASE("Only one cast runs at a time") {
    Rig rig;
    rig.dispatcher->latency = std::chrono::milliseconds(50);
    auto engine = rig.engine();

    std::vector<ResolvedTarget> targets(4, ResolvedTarget{"lab0", "10.1.0.2", parseMac("00:50:56:00:00:02"), {}});
    OperationHandle<CastSummary> first = engine->startCast(targets, CastObserver(), 0, 1);
    REQUIRE_THROWS_AS(engine->startCast(targets), OperationInProgressError);

    engine->cancel();
    CastSummary summary = first.wait();
    REQUIRE(summary.cancelled);
    REQUIRE(summary.sent < 4);
    REQUIRE_FALSE(engine->castInProgress());
}

TEST_CASE("Invalid interface leaves no scan running") {
    Rig rig;
    auto engine = rig.engine();

    REQUIRE_THROWS_AS(engine->startScan({{"bad0", "10.1.0.1", "255.0.255.0"}}), InvalidInterfaceError);
    REQUIRE_FALSE(engine->scanInProgress());
    REQUIRE(rig.prober->probes.load() == 0);
}

TEST_CASE("Targets resolve against scanned devices and cast") {
    Rig rig;
    auto engine = rig.engine();
    engine->startScan({LAB}).wait();

    REQUIRE(engine->addTarget(TargetSelection::network("lab0", "10.1.0.0/29")));
    REQUIRE(engine->addTarget(TargetSelection::device("lab0", "10.1.0.2")));
    REQUIRE_FALSE(engine->addTarget(TargetSelection::device("lab0", "10.1.0.2")));
    REQUIRE(engine->getTargets().size() == 2);

    ResolutionReport report = engine->resolveTargets();
    REQUIRE(report.targets.size() == 3);
    REQUIRE(report.targets.back().broadcast_address == std::string("10.1.0.7"));

    std::atomic<size_t> events{0};
    CastObserver observer;
    observer.on_progress = [&](const CastProgress&) { events++; };

    CastSummary summary = engine->startCast(report.targets, observer, 4009).wait();
    REQUIRE(summary.sent == 3);
    REQUIRE(summary.failed == 0);
    REQUIRE(events.load() == 3);
    REQUIRE(rig.dispatcher->ports == std::vector<uint16_t>{4009, 4009, 4009});

    REQUIRE(engine->removeTarget(TargetSelection::device("lab0", "10.1.0.2")));
    engine->clearTargets();
    REQUIRE(engine->getTargets().empty());
}

TEST_CASE("Sleeping devices stay castable after a rescan") {
    Rig rig;
    auto engine = rig.engine();
    engine->startScan({LAB}).wait();

    rig.prober->online.clear();
    rig.prober->standby.clear();
    engine->startScan({LAB}).wait();

    std::vector<Device> devices = engine->getRegistry();
    REQUIRE(devices.size() == 2);
    for (const auto& device : devices) {
        REQUIRE(device.status == DeviceStatus::Offline);
        REQUIRE_FALSE(device.mac);
    }

    engine->addTarget(TargetSelection::network("lab0", "10.1.0.0/29"));
    ResolutionReport report = engine->resolveTargets();
    REQUIRE(report.targets.size() == 2);
    REQUIRE(formatMac(report.targets[0].mac) == "00:50:56:00:00:02");
}

TEST_CASE("State survives an engine restart") {
    Rig rig;
    {
        auto engine = rig.engine();
        engine->startScan({LAB}).wait();
        engine->addTarget(TargetSelection::device("lab0", "10.1.0.3"));
        engine->save();
    }

    auto engine = rig.engine();
    REQUIRE(engine->getRegistry().empty());
    REQUIRE(engine->load());
    REQUIRE(engine->getRegistry().size() == 2);
    REQUIRE(engine->getTargets().size() == 1);
    REQUIRE(engine->resolveTargets().targets.size() == 1);
}

TEST_CASE("Corrupt state falls back to empty") {
    Rig rig;
    rig.dir.write("known_devices.json", "this is not json");

    auto engine = rig.engine();
    REQUIRE_FALSE(engine->load());
    REQUIRE(engine->getRegistry().empty());
    REQUIRE(engine->getTargets().empty());
}

TEST_CASE("Engines are independent of each other") {
    Rig first_rig;
    Rig second_rig;
    auto first = first_rig.engine();
    auto second = second_rig.engine();

    OperationHandle<ScanSummary> a = first->startScan({LAB});
    OperationHandle<ScanSummary> b = second->startScan({LAB});
    a.wait();
    b.wait();

    first->addTarget(TargetSelection::device("lab0", "10.1.0.2"));
    REQUIRE(first->getTargets().size() == 1);
    REQUIRE(second->getTargets().empty());

    first->clearHistory();
    REQUIRE(first->getRegistry().empty());
    REQUIRE(second->getRegistry().size() == 2);
    REQUIRE_FALSE(std::filesystem::exists(first_rig.config.statePath()));
    REQUIRE(std::filesystem::exists(second_rig.config.statePath()));
}

TEST_CASE("Export and import through the engine") {
    Rig rig;
    auto source = rig.engine();
    source->startScan({LAB}).wait();
    source->addTarget(TargetSelection::network("lab0", "10.1.0.0/29"));
    source->exportTo(rig.dir.file("devices.json"), ExportFormat::Json);
    source->exportTo(rig.dir.file("devices.csv"), ExportFormat::Csv);
    source->save();

    Rig other;
    auto target = other.engine();
    ImportSummary summary = target->importFrom(rig.config.statePath());
    REQUIRE(summary.devices_added == 2);
    REQUIRE(summary.targets_added == 1);
    REQUIRE(target->getRegistry().size() == 2);

    ImportSummary again = target->importFrom(rig.dir.file("devices.json"));
    REQUIRE(again.devices_added == 0);
    REQUIRE(again.devices_updated == 2);
    REQUIRE(target->getRegistry().size() == 2);

    REQUIRE_THROWS_AS(target->importFrom(rig.dir.file("devices.csv")), ImportFormatError);
    REQUIRE(target->getRegistry().size() == 2);
    REQUIRE(target->getTargets().size() == 1);
}

TEST_CASE("Destroying an engine cancels its scan") {
    Rig rig;
    rig.prober->latency = std::chrono::milliseconds(20);
    OperationHandle<ScanSummary> handle;
    {
        auto engine = rig.engine();
        handle = engine->startScan({{"lab0", "10.1.0.1", "255.255.255.0"}}, ScanObserver(), 2);
    }
    REQUIRE(handle.finished());
    ScanSummary summary = handle.wait();
    REQUIRE(summary.cancelled);
    REQUIRE(summary.completed < summary.total);
}

TEST_CASE("Importing during a scan keeps the scanned devices") {
    Rig rig;
    const NetworkInterface office{"eth0", "192.168.7.10", "255.255.255.0"};
    for (int host = 1; host <= 254; host++) {
        rig.prober->setOnline("192.168.7." + std::to_string(host));
    }
    rig.prober->latency = std::chrono::milliseconds(2);
    auto engine = rig.engine();

    // Large enough that the merge overlaps the running scan
    nlohmann::json devices = nlohmann::json::array();
    for (int i = 0; i < 20000; i++) {
        devices.push_back({{"interface", "archive0"},
                           {"ip", "10." + std::to_string(i / 65536) + "." + std::to_string((i / 256) % 256) +
                                  "." + std::to_string(i % 256)},
                           {"status", "offline"}});
    }
    devices.push_back({{"interface", "eth0"}, {"ip", "192.168.7.77"}, {"hostname", "printer.lan"}});
    rig.dir.write("archive.json", devices.dump());

    OperationHandle<ScanSummary> scan = engine->startScan({office}, ScanObserver(), 4);
    ImportSummary imported = engine->importFrom(rig.dir.file("archive.json"));
    ScanSummary summary = scan.wait();

    REQUIRE(imported.devices_read == 20001);
    REQUIRE(summary.online == 254);

    size_t office_devices = 0;
    size_t archived = 0;
    for (const auto& device : engine->getRegistry()) {
        if (device.interface_name == "eth0") office_devices++;
        if (device.interface_name == "archive0") archived++;
    }
    REQUIRE(office_devices == summary.online);
    REQUIRE(archived == 20000);

    auto printer = engine->getRegistry();
    auto it = std::find_if(printer.begin(), printer.end(),
                           [](const Device& d) { return d.ip_address == "192.168.7.77"; });
    REQUIRE(it != printer.end());
    REQUIRE(it->hostname == std::string("printer.lan"));
    REQUIRE(it->status == DeviceStatus::Online);
}

TEST_CASE("Loading merges the state file into memory") {
    Rig rig;
    rig.config.autosave = false;

    PersistedState persisted;
    Device stale;
    stale.interface_name = "lab0";
    stale.ip_address = "10.1.0.2";
    stale.status = DeviceStatus::Offline;
    stale.hostname = std::string("stale.lan");
    Device sleeper;
    sleeper.interface_name = "lab0";
    sleeper.ip_address = "10.1.0.6";
    sleeper.status = DeviceStatus::Offline;
    sleeper.last_known_mac = parseMac("00:50:56:00:00:06");
    persisted.interfaces["lab0"] = {stale, sleeper};
    persisted.targets.add(TargetSelection::device("lab0", "10.1.0.6"));
    PersistenceStore(rig.config.statePath()).save(persisted);

    auto engine = rig.engine();
    engine->addTarget(TargetSelection::network("lab0", "10.1.0.0/29"));
    engine->startScan({LAB}).wait();
    REQUIRE(engine->load());

    std::vector<Device> devices = engine->getRegistry();
    REQUIRE(devices.size() == 3);
    REQUIRE(devices[0].ip_address == "10.1.0.2");
    REQUIRE(devices[0].status == DeviceStatus::Online);
    REQUIRE_FALSE(devices[0].hostname);
    REQUIRE(devices[2].ip_address == "10.1.0.6");
    REQUIRE(engine->getTargets().size() == 2);
}
