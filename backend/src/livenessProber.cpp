#include "livenessProber.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

/**
 * Owns a socket descriptor and closes it on scope exit
 */
class ScopedFd {
private:
    int fd;

public:
    explicit ScopedFd(int fd = -1) : fd(fd) {}
    ~ScopedFd() { if (fd >= 0) close(fd); }

    ScopedFd(ScopedFd&& other) noexcept : fd(other.fd) { other.fd = -1; }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd; }
};

using Clock = std::chrono::steady_clock;

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// RFC 1071 internet checksum
uint16_t icmpChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;
    while (length > 1) {
        uint16_t word;
        std::memcpy(&word, data, sizeof(word));
        sum += word;
        data += 2;
        length -= 2;
    }
    if (length == 1) {
        sum += *data;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

std::atomic<uint16_t> g_next_sequence{1};
std::atomic<bool> g_icmp_warned{false};

}

LivenessProber::LivenessProber(const ProbeSettings& settings) : settings(settings) {}

DeviceStatus LivenessProber::probe(const std::string& address) {
    uint32_t ip = parseIPv4(address);

    if (ping(ip, settings.ping_timeout_ms)) {
        LOG_DEBUG(address, " answered ICMP echo");
        return DeviceStatus::Online;
    }

    if (!settings.standby_ports.empty() &&
        probePorts(ip, settings.standby_ports, settings.port_timeout_ms)) {
        LOG_DEBUG(address, " accepted a TCP connection, host is in standby");
        return DeviceStatus::Standby;
    }

    return DeviceStatus::Offline;
}

bool LivenessProber::ping(uint32_t address, int timeout_ms) {
    // Unprivileged ICMP datagram socket first (net.ipv4.ping_group_range),
    // raw socket if we hold CAP_NET_RAW
    bool raw = false;
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd < 0) {
        fd = socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        raw = true;
    }
    if (fd < 0) {
        if (!g_icmp_warned.exchange(true)) {
            LOG_WARNING("ICMP sockets unavailable (", strerror(errno), "), using port probes only");
        }
        return false;
    }
    ScopedFd guard(fd);

    uint16_t identifier = static_cast<uint16_t>(getpid() & 0xFFFF);
    uint16_t sequence = g_next_sequence++;

    alignas(struct icmphdr) uint8_t request[sizeof(struct icmphdr) + 16];
    std::memset(request, 0, sizeof(request));
    struct icmphdr* header = reinterpret_cast<struct icmphdr*>(request);
    header->type = ICMP_ECHO;
    header->code = 0;
    header->un.echo.id = htons(identifier);
    header->un.echo.sequence = htons(sequence);
    header->checksum = icmpChecksum(request, sizeof(request));

    struct sockaddr_in target;
    std::memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_addr.s_addr = htonl(address);

    if (sendto(fd, request, sizeof(request), 0, (struct sockaddr*)&target, sizeof(target)) < 0) {
        LOG_DEBUG("ICMP send to ", formatIPv4(address), " failed: ", strerror(errno));
        return false;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    uint8_t buffer[1500];

    while (true) {
        int wait_ms = remainingMs(deadline);
        if (wait_ms <= 0) return false;

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (ready == 0) return false;

        struct sockaddr_in sender;
        socklen_t sender_len = sizeof(sender);
        ssize_t received = recvfrom(fd, buffer, sizeof(buffer), 0, (struct sockaddr*)&sender, &sender_len);
        if (received <= 0) continue;
        if (ntohl(sender.sin_addr.s_addr) != address) continue;

        // Raw sockets deliver the IP header as well
        size_t offset = 0;
        if (raw) {
            offset = static_cast<size_t>(buffer[0] & 0x0F) * 4;
        }
        if (static_cast<size_t>(received) < offset + sizeof(struct icmphdr)) continue;

        struct icmphdr reply;
        std::memcpy(&reply, buffer + offset, sizeof(reply));
        if (reply.type != ICMP_ECHOREPLY) continue;
        if (ntohs(reply.un.echo.sequence) != sequence) continue;
        // Datagram sockets get their identifier rewritten by the kernel
        if (raw && ntohs(reply.un.echo.id) != identifier) continue;

        return true;
    }
}

bool LivenessProber::probePorts(uint32_t address, const std::vector<uint16_t>& ports, int timeout_ms) {
    std::vector<ScopedFd> sockets;
    std::vector<struct pollfd> pending;
    sockets.reserve(ports.size());
    pending.reserve(ports.size());

    for (uint16_t port : ports) {
        int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
        if (fd < 0) {
            LOG_DEBUG("Cannot create probe socket: ", strerror(errno));
            continue;
        }
        sockets.emplace_back(fd);

        struct sockaddr_in target;
        std::memset(&target, 0, sizeof(target));
        target.sin_family = AF_INET;
        target.sin_port = htons(port);
        target.sin_addr.s_addr = htonl(address);

        if (::connect(fd, (struct sockaddr*)&target, sizeof(target)) == 0) {
            return true;
        }
        if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            pending.push_back(pfd);
        }
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t open_count = pending.size();

    while (open_count > 0) {
        int wait_ms = remainingMs(deadline);
        if (wait_ms <= 0) break;

        int ready = poll(pending.data(), pending.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) break;

        for (auto& pfd : pending) {
            if (pfd.fd < 0 || pfd.revents == 0) continue;

            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(pfd.fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0) {
                return true;
            }
            // Refused or unreachable; negative fds are ignored by poll()
            pfd.fd = -1;
            open_count--;
        }
    }

    return false;
}
