#include "networkDiscovery.hpp"
#include "addressSpace.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <optional>
#include <ifaddrs.h>      // For getting network interface addresses
#include <net/if.h>       // For IFF_UP / IFF_LOOPBACK

namespace {

struct ScanItem {
    size_t interface_index;
    uint32_t address;
};

}

NetworkDiscovery::NetworkDiscovery(LivenessProber& prober, MacResolver& resolver, const OuiTable& vendors,
                                   const ScanOptions& options)
    : prober(prober), resolver(resolver), vendors(vendors), options(options) {}

Device NetworkDiscovery::scanAddress(const NetworkInterface& iface, uint32_t address) {
    Device device;
    device.interface_name = iface.name;
    device.ip_address = formatIPv4(address);
    device.status = prober.probe(device.ip_address);

    // ARP is only worth attempting for hosts that answered something
    if (isResponsive(device.status)) {
        device.mac = resolver.resolve(device.ip_address);
        if (device.mac) {
            device.last_known_mac = device.mac;
            device.vendor = vendors.vendorOf(*device.mac);
        }
        if (options.resolve_hostnames) {
            device.hostname = resolver.lookupHostname(device.ip_address);
        }
        device.last_seen = std::chrono::system_clock::now();
    }

    return device;
}

ScanSummary NetworkDiscovery::scan(const std::vector<NetworkInterface>& interfaces, const CancellationToken& token) {
    auto start_time = std::chrono::steady_clock::now();

    // Validate every interface before touching the network
    std::vector<AddressRange> ranges;
    ranges.reserve(interfaces.size());
    ScanSummary summary;
    for (const auto& iface : interfaces) {
        ranges.emplace_back(iface);
        summary.total += static_cast<size_t>(ranges.back().size());
        LOG_INFO("Scrying ", iface.name, " ", ranges.back().cidr(), " (", ranges.back().size(), " addresses)");
    }

    // Generator state, only touched under the pool's dispatch lock
    size_t range_index = 0;
    uint64_t offset = 0;
    auto next = [&]() -> std::optional<ScanItem> {
        while (range_index < ranges.size() && offset >= ranges[range_index].size()) {
            range_index++;
            offset = 0;
        }
        if (range_index >= ranges.size()) return std::nullopt;
        ScanItem item{range_index, ranges[range_index].at(offset)};
        offset++;
        return item;
    };

    // Single serialization point for counters and callbacks
    std::mutex results_mutex;

    auto work = [&](const ScanItem& item) {
        const NetworkInterface& iface = interfaces[item.interface_index];
        std::optional<Device> device;
        std::string failure;

        try {
            device = scanAddress(iface, item.address);
        } catch (const std::exception& e) {
            failure = e.what();
        }

        std::lock_guard<std::mutex> lock(results_mutex);
        summary.completed++;

        if (device) {
            switch (device->status) {
                case DeviceStatus::Online:  summary.online++;  break;
                case DeviceStatus::Standby: summary.standby++; break;
                case DeviceStatus::Offline: summary.offline++; break;
                case DeviceStatus::Unknown: break;
            }
        } else {
            LOG_WARNING("Probe of ", formatIPv4(item.address), " on ", iface.name, " failed: ", failure);
            summary.failures.push_back({iface.name, formatIPv4(item.address), failure});
        }

        // A throwing observer must not take the worker down with it
        try {
            if (device && device_found_callback) {
                device_found_callback(*device);
            }
            if (progress_callback) {
                progress_callback({iface.name, formatIPv4(item.address), summary.completed, summary.total});
            }
        } catch (const std::exception& e) {
            LOG_WARNING("Scan observer raised: ", e.what());
        }
    };

    if (summary.total > 0) {
        size_t workers = std::min<size_t>(std::max<size_t>(options.concurrency, 1), summary.total);
        runBounded<ScanItem>(workers, token, next, work);
    }

    summary.cancelled = token.isCancelled();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    LOG_INFO("Scry ", summary.cancelled ? "cancelled" : "complete", ": ",
             summary.completed, "/", summary.total, " addresses, ",
             summary.online, " online, ", summary.standby, " standby, ",
             summary.offline, " offline, ", summary.failed(), " failed in ",
             summary.elapsed.count(), "ms");
    return summary;
}

std::vector<NetworkInterface> listInterfaces() {
    std::vector<NetworkInterface> result;

    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        LOG_ERROR("getifaddrs failed: ", strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || !ifa->ifa_netmask) {
            continue;
        }
        // Skip loopback and interfaces that are administratively down
        if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }

        struct sockaddr_in* addr = (struct sockaddr_in*)ifa->ifa_addr;
        struct sockaddr_in* netmask = (struct sockaddr_in*)ifa->ifa_netmask;

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.ip_address = formatIPv4(ntohl(addr->sin_addr.s_addr));
        iface.netmask = formatIPv4(ntohl(netmask->sin_addr.s_addr));

        try {
            netmaskToPrefix(iface.netmask);
        } catch (const InvalidInterfaceError& e) {
            LOG_WARNING("Skipping interface ", iface.name, ": ", e.what());
            continue;
        }

        LOG_DEBUG("Found interface ", iface.name, " ", iface.ip_address, "/", iface.netmask);
        result.push_back(iface);
    }
    freeifaddrs(interfaces);

    return result;
}
