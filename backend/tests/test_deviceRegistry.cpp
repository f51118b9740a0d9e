#include <catch2/catch.hpp>

#include <thread>
#include "deviceRegistry.hpp"

static Device observed(const std::string& ip, DeviceStatus status, const char* mac = nullptr) {
    Device device;
    device.interface_name = "eth0";
    device.ip_address = ip;
    device.status = status;
    if (mac) device.mac = parseMac(mac);
    if (status != DeviceStatus::Offline) device.last_seen = std::chrono::system_clock::now();
    return device;
}

TEST_CASE("A sleeping device keeps its identity") {
    DeviceRegistry registry;

    Device awake = observed("192.168.1.20", DeviceStatus::Online, "00:11:32:AA:BB:CC");
    awake.hostname = std::string("nas.local");
    awake.vendor = std::string("Synology");
    REQUIRE(registry.upsertObservation(awake) == DeviceRegistry::UpsertResult::Added);

    REQUIRE(registry.upsertObservation(observed("192.168.1.20", DeviceStatus::Offline))
            == DeviceRegistry::UpsertResult::Updated);

    auto device = registry.find("eth0", "192.168.1.20");
    REQUIRE(device);
    REQUIRE(device->status == DeviceStatus::Offline);
    REQUIRE_FALSE(device->mac);
    REQUIRE(device->last_known_mac);
    REQUIRE(formatMac(*device->effectiveMac()) == "00:11:32:AA:BB:CC");
    REQUIRE(device->hostname == std::string("nas.local"));
    REQUIRE(device->vendor == std::string("Synology"));
    REQUIRE(device->last_seen == awake.last_seen);
}

TEST_CASE("Waking device refreshes its record") {
    DeviceRegistry registry;
    registry.upsertObservation(observed("192.168.1.20", DeviceStatus::Online, "00:11:32:AA:BB:CC"));
    registry.upsertObservation(observed("192.168.1.20", DeviceStatus::Offline));
    registry.upsertObservation(observed("192.168.1.20", DeviceStatus::Standby, "00:11:32:AA:BB:CD"));

    auto device = registry.find("eth0", "192.168.1.20");
    REQUIRE(device->status == DeviceStatus::Standby);
    REQUIRE(formatMac(*device->mac) == "00:11:32:AA:BB:CD");
    REQUIRE(formatMac(*device->last_known_mac) == "00:11:32:AA:BB:CD");
}

TEST_CASE("Never-seen offline addresses are only recorded on request") {
    DeviceRegistry registry;

    REQUIRE(registry.upsertObservation(observed("192.168.1.9", DeviceStatus::Offline))
            == DeviceRegistry::UpsertResult::Ignored);
    REQUIRE(registry.size() == 0);

    REQUIRE(registry.upsertObservation(observed("192.168.1.9", DeviceStatus::Offline), true)
            == DeviceRegistry::UpsertResult::Added);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Devices are ordered by interface then numeric address") {
    DeviceRegistry registry;
    registry.put(observed("192.168.1.10", DeviceStatus::Online));
    registry.put(observed("192.168.1.2", DeviceStatus::Online));
    Device other = observed("10.0.0.1", DeviceStatus::Online);
    other.interface_name = "wlan0";
    registry.put(other);

    std::vector<Device> devices = registry.snapshot();
    REQUIRE(devices.size() == 3);
    REQUIRE(devices[0].ip_address == "192.168.1.2");
    REQUIRE(devices[1].ip_address == "192.168.1.10");
    REQUIRE(devices[2].interface_name == "wlan0");

    auto grouped = registry.byInterface();
    REQUIRE(grouped["eth0"].size() == 2);
    REQUIRE(grouped["wlan0"].size() == 1);

    registry.clear();
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Concurrent upserts from many workers") {
    DeviceRegistry registry;
    std::vector<std::thread> workers;

    for (int t = 0; t < 8; t++) {
        workers.emplace_back([&registry, t]() {
            for (int i = 1; i <= 32; i++) {
                std::string ip = "10.0." + std::to_string(t) + "." + std::to_string(i);
                registry.upsertObservation(observed(ip, DeviceStatus::Online, "52:54:00:00:00:01"));
                registry.upsertObservation(observed(ip, DeviceStatus::Offline));
            }
        });
    }
    for (auto& worker : workers) worker.join();

    REQUIRE(registry.size() == 8 * 32);
    for (const auto& device : registry.snapshot()) {
        REQUIRE(device.status == DeviceStatus::Offline);
        REQUIRE(device.last_known_mac);
    }
}

TEST_CASE("Imported records merge one key at a time") {
    DeviceRegistry registry;
    Device nas = observed("192.168.1.20", DeviceStatus::Online, "00:11:32:AA:BB:CC");
    nas.vendor = std::string("Synology");
    registry.upsertObservation(nas);
    registry.upsertObservation(observed("192.168.1.21", DeviceStatus::Online));

    DeviceRecord rename;
    rename.interface_name = "eth0";
    rename.ip_address = "192.168.1.20";
    rename.hostname = std::string("storage.lan");

    DeviceRecord sleeper;
    sleeper.interface_name = "eth0";
    sleeper.ip_address = "192.168.1.40";
    sleeper.mac = parseMac("52:54:00:12:34:56");
    sleeper.status = DeviceStatus::Offline;

    DeviceRegistry::MergeCounts counts = registry.mergeRecords({rename, sleeper});
    REQUIRE(counts.added == 1);
    REQUIRE(counts.updated == 1);
    REQUIRE(registry.size() == 3);

    auto merged = registry.find("eth0", "192.168.1.20");
    REQUIRE(merged->hostname == std::string("storage.lan"));
    REQUIRE(merged->vendor == std::string("Synology"));
    REQUIRE(formatMac(*merged->mac) == "00:11:32:AA:BB:CC");

    auto added = registry.find("eth0", "192.168.1.40");
    REQUIRE_FALSE(added->mac);
    REQUIRE(formatMac(*added->last_known_mac) == "52:54:00:12:34:56");

    REQUIRE(registry.find("eth0", "192.168.1.21"));
}

TEST_CASE("Restoring persisted devices never drops or overrides live ones") {
    DeviceRegistry registry;
    Device live = observed("192.168.1.20", DeviceStatus::Online, "00:11:32:AA:BB:CC");
    live.hostname = std::string("live.lan");
    registry.upsertObservation(live);

    Device stale = observed("192.168.1.20", DeviceStatus::Offline);
    stale.hostname = std::string("stale.lan");
    Device other = observed("192.168.1.30", DeviceStatus::Standby, "52:54:00:00:00:30");

    REQUIRE(registry.restore({{"eth0", {stale, other}}}) == 1);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.find("eth0", "192.168.1.20")->hostname == std::string("live.lan"));
    REQUIRE(registry.find("eth0", "192.168.1.30")->status == DeviceStatus::Standby);
}
