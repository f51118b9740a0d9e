#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include "networkTypes.hpp"

/**
 * Lazy, restartable sequence of the usable host addresses in one subnet
 *
 * Subnets with 4 or more addresses exclude the network and broadcast
 * addresses. A /31 yields both of its addresses and a /32 yields its single
 * address, since neither has a network/broadcast address to drop.
 * Addresses are produced one at a time from a counter, so a /16 costs no
 * more memory than a /30.
 */
class AddressRange {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = std::string;

        const_iterator() : current(0) {}
        explicit const_iterator(uint64_t current) : current(current) {}

        std::string operator*() const { return formatIPv4(static_cast<uint32_t>(current)); }
        uint32_t address() const { return static_cast<uint32_t>(current); }

        const_iterator& operator++() { ++current; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++current; return tmp; }

        bool operator==(const const_iterator& other) const { return current == other.current; }
        bool operator!=(const const_iterator& other) const { return current != other.current; }

    private:
        // 64-bit so that one-past-255.255.255.255 does not wrap
        uint64_t current;
    };

    /**
     * Builds the host range of an interface's subnet
     * @param iface: Interface snapshot (address + netmask)
     * Throws InvalidInterfaceError if the address or mask cannot be parsed
     */
    explicit AddressRange(const NetworkInterface& iface);

    /**
     * Builds the host range of a CIDR block
     * @param cidr: e.g. "192.168.1.0/24"; host bits are ignored
     * Throws InvalidInterfaceError if the block cannot be parsed
     */
    static AddressRange fromCidr(const std::string& cidr);

    const_iterator begin() const { return const_iterator(first); }
    const_iterator end() const { return const_iterator(last + 1); }

    // Number of host addresses the sequence yields
    uint64_t size() const { return last + 1 - first; }

    bool contains(uint32_t address) const { return address >= first && address <= last; }
    bool contains(const std::string& address) const;

    int prefixLength() const { return prefix; }
    std::string cidr() const;

    // Directed broadcast address; none for /31 and /32
    std::optional<std::string> broadcastAddress() const;

    // Sequence element at position index (0-based), index < size()
    uint32_t at(uint64_t index) const { return static_cast<uint32_t>(first + index); }

private:
    AddressRange(uint32_t address, int prefix);

    // Throws InvalidInterfaceError if the interface address cannot be parsed
    static uint32_t interfaceAddress(const NetworkInterface& iface);

    uint32_t network;
    int prefix;
    uint64_t first;
    uint64_t last;
};
