#pragma once

#include <array>
#include <cstdint>
#include <string>

/**
 * IPv4 and MAC address helpers shared by the enumerator, prober,
 * resolver, codec and persistence layers
 * IPv4 addresses are carried as host byte order uint32_t internally and
 * as dotted-quad strings at the API surface
 */

using MacAddress = std::array<uint8_t, 6>;

/**
 * Converts dotted-quad text to a host byte order address
 * @param text: e.g. "192.168.1.10"
 * @return: Address in host byte order
 * Throws InvalidAddressError if text is not a valid IPv4 address
 */
uint32_t parseIPv4(const std::string& text);

// Non-throwing variant of parseIPv4
bool tryParseIPv4(const std::string& text, uint32_t& out);

std::string formatIPv4(uint32_t address);

/**
 * Converts netmask text ("255.255.255.0") to a prefix length
 * @return: Prefix length 0..32
 * Throws InvalidInterfaceError if the mask is unparseable or non-contiguous
 */
int netmaskToPrefix(const std::string& netmask);

uint32_t prefixToMask(int prefix);

/**
 * Parses MAC text into 6 octets
 * Accepts ':' or '-' separated groups of 1-2 hex digits (short groups are
 * zero padded, "0:3e:e1:b7:57:54" -> 00:3E:E1:B7:57:54) or 12 bare hex digits
 * Throws InvalidMACError on anything else
 */
MacAddress parseMac(const std::string& text);

bool tryParseMac(const std::string& text, MacAddress& out);

// Upper case, colon separated: "AA:BB:CC:DD:EE:FF"
std::string formatMac(const MacAddress& mac);

/**
 * Snapshot of one IPv4 address configured on a local interface
 * Taken at scan start; interfaces are re-enumerated on every scan
 */
struct NetworkInterface {
    std::string name;          // Kernel interface name, e.g. "eth0"
    std::string ip_address;    // Local address on this interface
    std::string netmask;       // Dotted-quad netmask

    int prefixLength() const;
    std::string networkAddress() const;
    std::string broadcastAddress() const;

    // "192.168.1.0/24" for 192.168.1.10 / 255.255.255.0
    std::string cidr() const;
};
