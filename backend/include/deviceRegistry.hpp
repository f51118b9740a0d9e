#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "device.hpp"

/**
 * Thread-safe store of every known Device, keyed by (interface, IP)
 * Devices are never removed automatically; only clear() drops them.
 */
class DeviceRegistry {
public:
    typedef std::pair<std::string, std::string> Key;   // (interface name, IP)

    enum class UpsertResult {
        Added,
        Updated,
        Ignored
    };

    DeviceRegistry() = default;

    /**
     * Folds a fresh probe result into the registry
     *
     * Responsive observations replace status, MAC, hostname, vendor and
     * last_seen. An offline observation of a known device only flips its
     * status to Offline and clears its current MAC; hostname, vendor,
     * last_seen and the last known MAC are kept. An offline observation of
     * an unknown address is recorded only if record_offline is set.
     */
    UpsertResult upsertObservation(const Device& observed, bool record_offline = false);

    // Stores device as-is, replacing any existing record with the same key
    void put(const Device& device);

    std::optional<Device> find(const std::string& interface_name, const std::string& ip_address) const;

    // All devices, ordered by interface then numeric address
    std::vector<Device> snapshot() const;

    // Devices grouped by interface, each group ordered by numeric address
    std::map<std::string, std::vector<Device>> byInterface() const;

    struct MergeCounts {
        size_t added = 0;
        size_t updated = 0;
    };

    /**
     * Upserts imported records one key at a time
     * Fields a record carries overwrite, the rest of the device is kept and
     * no other device is touched
     */
    MergeCounts mergeRecords(const std::vector<DeviceRecord>& records);

    /**
     * Adds persisted devices whose key is not in the registry yet
     * Devices already present are newer and win
     * @return: Number of devices added
     */
    size_t restore(const std::map<std::string, std::vector<Device>>& grouped);

    void clear();
    size_t size() const;

private:
    // Orders by interface, then by numeric address rather than text
    struct KeyLess {
        bool operator()(const Key& a, const Key& b) const;
    };

    mutable std::mutex devices_mutex;
    std::map<Key, Device, KeyLess> devices;
};
