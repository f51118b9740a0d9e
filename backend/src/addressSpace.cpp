#include "addressSpace.hpp"
#include "errors.hpp"

AddressRange::AddressRange(uint32_t address, int prefix) : prefix(prefix) {
    uint32_t mask = prefixToMask(prefix);
    network = address & mask;
    uint64_t broadcast = static_cast<uint64_t>(network) | (~mask & 0xFFFFFFFFu);
    uint64_t block = broadcast - network + 1;

    if (block >= 4) {
        // Drop the network and broadcast addresses
        first = static_cast<uint64_t>(network) + 1;
        last = broadcast - 1;
    } else {
        // /31 point-to-point and /32 host routes have nothing to exclude
        first = network;
        last = broadcast;
    }
}

AddressRange::AddressRange(const NetworkInterface& iface)
    : AddressRange(interfaceAddress(iface), netmaskToPrefix(iface.netmask)) {}

uint32_t AddressRange::interfaceAddress(const NetworkInterface& iface) {
    uint32_t ip = 0;
    if (!tryParseIPv4(iface.ip_address, ip)) {
        throw InvalidInterfaceError("interface " + iface.name + " has invalid address '" + iface.ip_address + "'");
    }
    return ip;
}

AddressRange AddressRange::fromCidr(const std::string& cidr) {
    size_t slash = cidr.find('/');
    if (slash == std::string::npos) {
        throw InvalidInterfaceError("CIDR block without prefix: '" + cidr + "'");
    }

    uint32_t ip = 0;
    if (!tryParseIPv4(cidr.substr(0, slash), ip)) {
        throw InvalidInterfaceError("CIDR block with invalid address: '" + cidr + "'");
    }

    std::string prefix_text = cidr.substr(slash + 1);
    if (prefix_text.empty() || prefix_text.size() > 2 ||
        prefix_text.find_first_not_of("0123456789") != std::string::npos) {
        throw InvalidInterfaceError("CIDR block with invalid prefix: '" + cidr + "'");
    }
    int prefix = std::stoi(prefix_text);
    if (prefix > 32) {
        throw InvalidInterfaceError("CIDR prefix out of range: '" + cidr + "'");
    }
    return AddressRange(ip, prefix);
}

bool AddressRange::contains(const std::string& address) const {
    uint32_t ip = 0;
    return tryParseIPv4(address, ip) && contains(ip);
}

std::string AddressRange::cidr() const {
    return formatIPv4(network) + "/" + std::to_string(prefix);
}

std::optional<std::string> AddressRange::broadcastAddress() const {
    if (prefix >= 31) return std::nullopt;
    return formatIPv4(static_cast<uint32_t>(last + 1));
}
