#include "macResolver.hpp"
#include "logging.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <netdb.h>
#include <sstream>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

MacResolver::MacResolver(int wait_ms, const std::string& arp_table_path)
    : wait_ms(wait_ms), arp_table_path(arp_table_path) {}

std::optional<MacAddress> MacResolver::resolve(const std::string& address) {
    uint32_t ip = parseIPv4(address);

    std::optional<MacAddress> mac = lookupNeighbor(address);
    if (mac) return mac;

    stimulate(ip);

    // Poll the table until the kernel finishes (or gives up on) ARP
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
        mac = lookupNeighbor(address);
        if (mac) return mac;
    }

    LOG_DEBUG("No neighbor entry for ", address, " after ", wait_ms, "ms");
    return std::nullopt;
}

std::optional<std::string> MacResolver::lookupHostname(const std::string& address) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    // NI_NAMEREQD: fail instead of echoing the numeric address back
    int rc = getnameinfo((struct sockaddr*)&addr, sizeof(addr), host, sizeof(host),
                         nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        return std::nullopt;
    }
    return std::string(host);
}

std::optional<MacAddress> MacResolver::parseArpTable(std::istream& table, const std::string& address) {
    std::string line;

    // Header: "IP address  HW type  Flags  HW address  Mask  Device"
    if (!std::getline(table, line)) return std::nullopt;

    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string ip, hw_type, flags, hw_address;
        if (!(fields >> ip >> hw_type >> flags >> hw_address)) continue;
        if (ip != address) continue;

        // ATF_COM (0x2) marks a completed entry
        unsigned long flag_bits = std::strtoul(flags.c_str(), nullptr, 16);
        if ((flag_bits & 0x2) == 0) continue;

        MacAddress mac{};
        if (!tryParseMac(hw_address, mac)) continue;

        bool all_zero = true;
        for (uint8_t octet : mac) {
            if (octet != 0) { all_zero = false; break; }
        }
        if (all_zero) continue;

        return mac;
    }
    return std::nullopt;
}

std::optional<MacAddress> MacResolver::lookupNeighbor(const std::string& address) {
    std::ifstream table(arp_table_path);
    if (!table.is_open()) {
        LOG_DEBUG("Cannot read neighbor table ", arp_table_path);
        return std::nullopt;
    }
    return parseArpTable(table, address);
}

void MacResolver::stimulate(uint32_t address) {
    // Any unicast datagram forces the kernel to resolve the next hop
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        LOG_DEBUG("Cannot create ARP stimulus socket: ", strerror(errno));
        return;
    }

    struct sockaddr_in target;
    std::memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_port = htons(9);   // discard
    target.sin_addr.s_addr = htonl(address);

    char byte = 0;
    if (sendto(fd, &byte, sizeof(byte), MSG_DONTWAIT, (struct sockaddr*)&target, sizeof(target)) < 0) {
        LOG_DEBUG("ARP stimulus to ", formatIPv4(address), " failed: ", strerror(errno));
    }
    close(fd);
}
