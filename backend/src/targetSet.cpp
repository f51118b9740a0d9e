#include "targetSet.hpp"
#include "addressSpace.hpp"
#include "logging.hpp"
#include <algorithm>
#include <map>

TargetSelection TargetSelection::network(const std::string& interface_name, const std::string& cidr) {
    TargetSelection selection;
    selection.kind = Kind::Network;
    selection.interface_name = interface_name;
    // Canonical form so "192.168.1.7/24" and "192.168.1.0/24" are the same selection
    selection.cidr = AddressRange::fromCidr(cidr).cidr();
    return selection;
}

TargetSelection TargetSelection::device(const std::string& interface_name, const std::string& ip_address) {
    TargetSelection selection;
    selection.kind = Kind::Device;
    selection.interface_name = interface_name;
    selection.ip_address = formatIPv4(parseIPv4(ip_address));
    return selection;
}

bool TargetSelection::operator==(const TargetSelection& other) const {
    if (kind != other.kind || interface_name != other.interface_name) return false;
    switch (kind) {
        case Kind::Network: return cidr == other.cidr;
        case Kind::Device:  return ip_address == other.ip_address;
    }
    return false;
}

std::string TargetSelection::describe() const {
    switch (kind) {
        case Kind::Network: return "network " + interface_name + " " + cidr;
        case Kind::Device:  return "device " + interface_name + " " + ip_address;
    }
    return "";
}

bool TargetSet::add(const TargetSelection& selection) {
    // Re-validate: selections may come from deserialized state
    TargetSelection canonical = selection.kind == TargetSelection::Kind::Network
        ? TargetSelection::network(selection.interface_name, selection.cidr)
        : TargetSelection::device(selection.interface_name, selection.ip_address);

    if (contains(canonical)) return false;
    selections.push_back(canonical);
    return true;
}

bool TargetSet::remove(const TargetSelection& selection) {
    auto it = std::find(selections.begin(), selections.end(), selection);
    if (it == selections.end()) return false;
    selections.erase(it);
    return true;
}

bool TargetSet::contains(const TargetSelection& selection) const {
    return std::find(selections.begin(), selections.end(), selection) != selections.end();
}

ResolutionReport TargetSet::resolve(const DeviceRegistry& registry,
                                    const std::map<std::string, std::string>& subnets) const {
    ResolutionReport report;

    // One consistent view for the whole resolution
    std::map<std::string, std::vector<Device>> known = registry.byInterface();

    auto findDevice = [&](const std::string& interface_name, const std::string& ip) -> const Device* {
        auto group = known.find(interface_name);
        if (group == known.end()) return nullptr;
        for (const auto& device : group->second) {
            if (device.ip_address == ip) return &device;
        }
        return nullptr;
    };

    for (const auto& selection : selections) {
        switch (selection.kind) {
            case TargetSelection::Kind::Network: {
                AddressRange range = AddressRange::fromCidr(selection.cidr);
                std::optional<std::string> broadcast = range.broadcastAddress();

                // Index this interface's devices by address, then walk the subnet in order
                std::map<uint32_t, const Device*> by_address;
                auto group = known.find(selection.interface_name);
                if (group != known.end()) {
                    for (const auto& device : group->second) {
                        uint32_t ip = 0;
                        if (tryParseIPv4(device.ip_address, ip) && range.contains(ip)) {
                            by_address[ip] = &device;
                        }
                    }
                }

                for (const auto& entry : by_address) {
                    const Device& device = *entry.second;
                    std::optional<MacAddress> mac = device.effectiveMac();
                    if (!mac) {
                        report.unresolvable.push_back({device.interface_name, device.ip_address, "MAC address not resolved"});
                        continue;
                    }
                    report.targets.push_back({device.interface_name, device.ip_address, *mac, broadcast});
                }
                break;
            }

            case TargetSelection::Kind::Device: {
                const Device* device = findDevice(selection.interface_name, selection.ip_address);
                if (!device) {
                    report.unresolvable.push_back({selection.interface_name, selection.ip_address, "device not in registry"});
                    break;
                }
                std::optional<MacAddress> mac = device->effectiveMac();
                if (!mac) {
                    report.unresolvable.push_back({selection.interface_name, selection.ip_address, "MAC address not resolved"});
                    break;
                }

                // Subnet of the interface if known, else of a covering network selection
                std::optional<std::string> broadcast;
                auto subnet = subnets.find(selection.interface_name);
                if (subnet != subnets.end()) {
                    AddressRange range = AddressRange::fromCidr(subnet->second);
                    if (range.contains(selection.ip_address)) {
                        broadcast = range.broadcastAddress();
                    }
                }
                for (const auto& other : selections) {
                    if (broadcast) break;
                    if (other.kind == TargetSelection::Kind::Network &&
                        other.interface_name == selection.interface_name) {
                        AddressRange range = AddressRange::fromCidr(other.cidr);
                        if (range.contains(selection.ip_address)) {
                            broadcast = range.broadcastAddress();
                        }
                    }
                }
                report.targets.push_back({device->interface_name, device->ip_address, *mac, broadcast});
                break;
            }
        }
    }

    LOG_DEBUG("Resolved ", selections.size(), " selections to ", report.targets.size(),
              " targets, ", report.unresolvable.size(), " unresolvable");
    return report;
}
