#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "networkTypes.hpp"

/**
 * Liveness classification of a device
 * Unknown is only used for records that were imported without a status
 */
enum class DeviceStatus {
    Online,     // Answered ICMP echo
    Standby,    // Ignored ICMP but accepted a TCP connection
    Offline,    // Nothing answered
    Unknown
};

const char* statusToString(DeviceStatus status);

/**
 * Parses "online", "standby", "offline" or "unknown"
 * @return: false if the text is none of these
 */
bool statusFromString(const std::string& text, DeviceStatus& status);

// Online and Standby hosts answered at least one probe
bool isResponsive(DeviceStatus status);

/**
 * One discovered (or imported) host
 * Identified by (interface_name, ip_address); an IP is only unique within
 * the subnet of one interface
 */
struct Device {
    std::string interface_name;
    std::string ip_address;
    std::optional<std::string> hostname;

    // MAC resolved by the latest observation; always empty while Offline
    std::optional<MacAddress> mac;

    // Most recently resolved MAC, kept while the host sleeps so it can be woken
    std::optional<MacAddress> last_known_mac;

    DeviceStatus status = DeviceStatus::Unknown;
    std::optional<std::string> vendor;

    // Epoch means "never seen responsive"
    std::chrono::system_clock::time_point last_seen{};

    // Current MAC if resolved, otherwise the last known one
    std::optional<MacAddress> effectiveMac() const {
        return mac ? mac : last_known_mac;
    }
};

/**
 * One device as read from an import or state file
 * Absent (or null) fields stay empty and do not overwrite on merge
 */
struct DeviceRecord {
    std::string interface_name;
    std::string ip_address;
    std::optional<std::string> hostname;
    std::optional<MacAddress> mac;
    std::optional<DeviceStatus> status;
    std::optional<std::string> vendor;
    std::optional<std::chrono::system_clock::time_point> last_seen;
};

/**
 * Applies a record onto a device, overwriting only what the record carries
 * The MAC lands in last_known_mac always and in mac only for responsive
 * hosts, so an offline record never carries a current MAC
 */
void applyRecord(Device& device, const DeviceRecord& record);
