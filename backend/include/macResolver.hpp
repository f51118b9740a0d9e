#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include "networkTypes.hpp"

/**
 * MacResolver maps a responsive IPv4 address to its hardware address by
 * reading the kernel neighbor (ARP) table
 *
 * If no entry exists yet, a throwaway UDP datagram is sent to the host to
 * make the kernel ARP for it, and the table is re-read until an entry shows
 * up or wait_ms elapses.
 */
class MacResolver {
public:
    /**
     * @param wait_ms: Upper bound on how long resolve() waits for an entry
     * @param arp_table_path: Neighbor table in /proc/net/arp format
     */
    explicit MacResolver(int wait_ms = 1000, const std::string& arp_table_path = "/proc/net/arp");
    virtual ~MacResolver() = default;

    /**
     * Resolves the MAC of address
     * @return: MAC, or std::nullopt if no complete entry appeared in time
     * Throws InvalidAddressError if address is malformed
     */
    std::optional<MacAddress> resolve(const std::string& address);

    /**
     * Reverse DNS lookup for a responsive host
     * @return: Host name, or std::nullopt if the address has no PTR record
     */
    virtual std::optional<std::string> lookupHostname(const std::string& address);

    /**
     * Finds address in a /proc/net/arp style table
     * Incomplete entries (flags 0x0 or an all-zero MAC) are ignored
     */
    static std::optional<MacAddress> parseArpTable(std::istream& table, const std::string& address);

protected:
    // Reads the current neighbor entry for address
    virtual std::optional<MacAddress> lookupNeighbor(const std::string& address);

    // Makes the kernel start ARP resolution for address
    virtual void stimulate(uint32_t address);

private:
    int wait_ms;
    std::string arp_table_path;
};
