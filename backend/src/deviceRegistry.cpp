#include "deviceRegistry.hpp"

bool DeviceRegistry::KeyLess::operator()(const Key& a, const Key& b) const {
    if (a.first != b.first) return a.first < b.first;

    uint32_t ip_a = 0;
    uint32_t ip_b = 0;
    if (tryParseIPv4(a.second, ip_a) && tryParseIPv4(b.second, ip_b)) {
        return ip_a < ip_b;
    }
    return a.second < b.second;
}

DeviceRegistry::UpsertResult DeviceRegistry::upsertObservation(const Device& observed, bool record_offline) {
    std::lock_guard<std::mutex> lock(devices_mutex);

    Key key(observed.interface_name, observed.ip_address);
    auto it = devices.find(key);

    if (isResponsive(observed.status)) {
        if (it == devices.end()) {
            Device device = observed;
            if (device.mac) device.last_known_mac = device.mac;
            devices.emplace(key, device);
            return UpsertResult::Added;
        }

        Device& existing = it->second;
        existing.status = observed.status;
        existing.mac = observed.mac;
        if (observed.mac) existing.last_known_mac = observed.mac;
        if (observed.hostname) existing.hostname = observed.hostname;
        if (observed.vendor) existing.vendor = observed.vendor;
        existing.last_seen = observed.last_seen;
        return UpsertResult::Updated;
    }

    if (it != devices.end()) {
        // Known host went quiet: keep its identity so it can still be woken
        it->second.status = observed.status;
        it->second.mac.reset();
        return UpsertResult::Updated;
    }

    if (!record_offline) {
        return UpsertResult::Ignored;
    }

    Device device = observed;
    device.mac.reset();
    devices.emplace(key, device);
    return UpsertResult::Added;
}

void DeviceRegistry::put(const Device& device) {
    std::lock_guard<std::mutex> lock(devices_mutex);
    devices[Key(device.interface_name, device.ip_address)] = device;
}

std::optional<Device> DeviceRegistry::find(const std::string& interface_name, const std::string& ip_address) const {
    std::lock_guard<std::mutex> lock(devices_mutex);
    auto it = devices.find(Key(interface_name, ip_address));
    if (it == devices.end()) return std::nullopt;
    return it->second;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(devices_mutex);
    std::vector<Device> result;
    result.reserve(devices.size());
    for (const auto& entry : devices) {
        result.push_back(entry.second);
    }
    return result;
}

std::map<std::string, std::vector<Device>> DeviceRegistry::byInterface() const {
    std::lock_guard<std::mutex> lock(devices_mutex);
    std::map<std::string, std::vector<Device>> result;
    for (const auto& entry : devices) {
        result[entry.first.first].push_back(entry.second);
    }
    return result;
}

DeviceRegistry::MergeCounts DeviceRegistry::mergeRecords(const std::vector<DeviceRecord>& records) {
    std::lock_guard<std::mutex> lock(devices_mutex);
    MergeCounts counts;
    for (const auto& record : records) {
        Key key(record.interface_name, record.ip_address);
        auto it = devices.find(key);
        if (it == devices.end()) {
            Device device;
            applyRecord(device, record);
            devices.emplace(key, device);
            counts.added++;
        } else {
            applyRecord(it->second, record);
            counts.updated++;
        }
    }
    return counts;
}

size_t DeviceRegistry::restore(const std::map<std::string, std::vector<Device>>& grouped) {
    std::lock_guard<std::mutex> lock(devices_mutex);
    size_t added = 0;
    for (const auto& group : grouped) {
        for (Device device : group.second) {
            device.interface_name = group.first;
            if (devices.emplace(Key(device.interface_name, device.ip_address), device).second) {
                added++;
            }
        }
    }
    return added;
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(devices_mutex);
    devices.clear();
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(devices_mutex);
    return devices.size();
}
