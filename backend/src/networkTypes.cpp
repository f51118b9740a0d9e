#include "networkTypes.hpp"
#include "errors.hpp"
#include <arpa/inet.h>
#include <cctype>
#include <cstdio>
#include <vector>

bool tryParseIPv4(const std::string& text, uint32_t& out) {
    // inet_pton only accepts strict dotted-quad, unlike inet_aton
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    out = ntohl(addr.s_addr);
    return true;
}

uint32_t parseIPv4(const std::string& text) {
    uint32_t address = 0;
    if (!tryParseIPv4(text, address)) {
        throw InvalidAddressError("invalid IPv4 address: '" + text + "'");
    }
    return address;
}

std::string formatIPv4(uint32_t address) {
    struct in_addr addr;
    addr.s_addr = htonl(address);
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr, ip_str, INET_ADDRSTRLEN);
    return ip_str;
}

uint32_t prefixToMask(int prefix) {
    if (prefix <= 0) return 0;
    if (prefix >= 32) return 0xFFFFFFFFu;
    return 0xFFFFFFFFu << (32 - prefix);
}

int netmaskToPrefix(const std::string& netmask) {
    uint32_t mask = 0;
    if (!tryParseIPv4(netmask, mask)) {
        throw InvalidInterfaceError("unparseable netmask: '" + netmask + "'");
    }

    int prefix = 0;
    while (prefix < 32 && (mask & (0x80000000u >> prefix))) {
        prefix++;
    }
    // Every bit after the first zero must be zero as well
    if (mask != prefixToMask(prefix)) {
        throw InvalidInterfaceError("non-contiguous netmask: '" + netmask + "'");
    }
    return prefix;
}

bool tryParseMac(const std::string& text, MacAddress& out) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    // Bare form: exactly 12 hex digits
    if (text.size() == 12 && text.find_first_of(":-") == std::string::npos) {
        for (size_t i = 0; i < 6; i++) {
            int hi = hexValue(text[i * 2]);
            int lo = hexValue(text[i * 2 + 1]);
            if (hi < 0 || lo < 0) return false;
            out[i] = static_cast<uint8_t>(hi * 16 + lo);
        }
        return true;
    }

    std::vector<std::string> groups;
    std::string current;
    for (char c : text) {
        if (c == ':' || c == '-') {
            groups.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    groups.push_back(current);

    if (groups.size() != 6) return false;

    for (size_t i = 0; i < 6; i++) {
        const std::string& group = groups[i];
        if (group.empty() || group.size() > 2) return false;
        int value = 0;
        for (char c : group) {
            int digit = hexValue(c);
            if (digit < 0) return false;
            value = value * 16 + digit;
        }
        out[i] = static_cast<uint8_t>(value);
    }
    return true;
}

MacAddress parseMac(const std::string& text) {
    MacAddress mac{};
    if (!tryParseMac(text, mac)) {
        throw InvalidMACError("invalid MAC address: '" + text + "'");
    }
    return mac;
}

std::string formatMac(const MacAddress& mac) {
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buffer;
}

int NetworkInterface::prefixLength() const {
    return netmaskToPrefix(netmask);
}

std::string NetworkInterface::networkAddress() const {
    uint32_t ip = 0;
    if (!tryParseIPv4(ip_address, ip)) {
        throw InvalidInterfaceError("interface " + name + " has invalid address '" + ip_address + "'");
    }
    return formatIPv4(ip & prefixToMask(prefixLength()));
}

std::string NetworkInterface::broadcastAddress() const {
    uint32_t ip = 0;
    if (!tryParseIPv4(ip_address, ip)) {
        throw InvalidInterfaceError("interface " + name + " has invalid address '" + ip_address + "'");
    }
    return formatIPv4(ip | ~prefixToMask(prefixLength()));
}

std::string NetworkInterface::cidr() const {
    return networkAddress() + "/" + std::to_string(prefixLength());
}
