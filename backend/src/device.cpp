#include "device.hpp"

const char* statusToString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:  return "online";
        case DeviceStatus::Standby: return "standby";
        case DeviceStatus::Offline: return "offline";
        case DeviceStatus::Unknown: return "unknown";
    }
    return "unknown";
}

bool statusFromString(const std::string& text, DeviceStatus& status) {
    if (text == "online") status = DeviceStatus::Online;
    else if (text == "standby") status = DeviceStatus::Standby;
    else if (text == "offline") status = DeviceStatus::Offline;
    else if (text == "unknown") status = DeviceStatus::Unknown;
    else return false;
    return true;
}

bool isResponsive(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Online:
        case DeviceStatus::Standby:
            return true;
        case DeviceStatus::Offline:
        case DeviceStatus::Unknown:
            return false;
    }
    return false;
}

void applyRecord(Device& device, const DeviceRecord& record) {
    device.interface_name = record.interface_name;
    device.ip_address = record.ip_address;
    if (record.hostname) device.hostname = record.hostname;
    if (record.vendor) device.vendor = record.vendor;
    if (record.status) device.status = *record.status;
    if (record.last_seen) device.last_seen = *record.last_seen;
    if (record.mac) device.last_known_mac = record.mac;

    if (isResponsive(device.status)) {
        if (record.mac) device.mac = record.mac;
    } else {
        device.mac.reset();
    }
}
