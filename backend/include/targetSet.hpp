#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "deviceRegistry.hpp"
#include "networkTypes.hpp"

/**
 * A user selection: either a whole network or one device
 */
struct TargetSelection {
    enum class Kind {
        Network,    // interface_name + cidr
        Device      // interface_name + ip_address
    };

    Kind kind = Kind::Device;
    std::string interface_name;
    std::string cidr;
    std::string ip_address;

    static TargetSelection network(const std::string& interface_name, const std::string& cidr);
    static TargetSelection device(const std::string& interface_name, const std::string& ip_address);

    bool operator==(const TargetSelection& other) const;
    bool operator!=(const TargetSelection& other) const { return !(*this == other); }

    // "network eth0 192.168.1.0/24" / "device eth0 192.168.1.20"
    std::string describe() const;
};

/**
 * One magic packet destination produced by resolution
 */
struct ResolvedTarget {
    std::string interface_name;
    std::string ip_address;
    MacAddress mac;

    // Directed broadcast address of the target's subnet, when known
    std::optional<std::string> broadcast_address;
};

// A selected device that cannot be packed into a magic packet
struct UnresolvableTarget {
    std::string interface_name;
    std::string ip_address;
    std::string reason;
};

struct ResolutionReport {
    std::vector<ResolvedTarget> targets;
    std::vector<UnresolvableTarget> unresolvable;
};

/**
 * TargetSet holds selections in insertion order with set semantics per
 * selection: adding the same network or device twice is a no-op.
 *
 * A network selection and a device selection inside that network are NOT
 * merged, and resolve() does not deduplicate across them: such a device
 * receives one packet per selection that covers it. The resolved count is
 * reported before casting, so the repetition is always visible.
 */
class TargetSet {
private:
    std::vector<TargetSelection> selections;

public:
    /**
     * @return: true if the selection was not already present
     * Throws InvalidInterfaceError for a network selection with a bad CIDR
     * and InvalidAddressError for a device selection with a bad address
     */
    bool add(const TargetSelection& selection);

    // @return: true if the selection was present
    bool remove(const TargetSelection& selection);

    void clear() { selections.clear(); }

    bool contains(const TargetSelection& selection) const;
    bool empty() const { return selections.empty(); }
    size_t size() const { return selections.size(); }

    const std::vector<TargetSelection>& getSelections() const { return selections; }

    /**
     * Turns the selections into (IP, MAC) destinations
     *
     * Network selections emit one target per address of the subnet that has
     * a known MAC in the registry; registry devices in the subnet without a
     * MAC are reported as unresolvable. Device selections emit one target
     * looked up fresh from the registry. Output follows selection order.
     *
     * @param registry: Source of MACs
     * @param subnets: Known interface name -> CIDR, used to fill in the
     *                 broadcast address of device selections
     */
    ResolutionReport resolve(const DeviceRegistry& registry,
                             const std::map<std::string, std::string>& subnets = {}) const;
};
