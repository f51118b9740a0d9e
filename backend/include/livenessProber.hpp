#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "device.hpp"

/**
 * Timeouts and ports for the tiered liveness probe
 */
struct ProbeSettings {
    int ping_timeout_ms = 500;
    int port_timeout_ms = 200;

    // HTTP, HTTPS, SSH, Telnet, RDP, VNC
    std::vector<uint16_t> standby_ports = {80, 443, 22, 23, 3389, 5900};
};

/**
 * LivenessProber classifies one address as online / standby / offline
 *
 * Tier 1: ICMP echo with ping_timeout_ms. A reply means Online.
 * Tier 2: TCP connect to every standby port at once, bounded by a single
 *         port_timeout_ms window. Any accepted connection means Standby.
 * Otherwise Offline. Worst case latency is ping + port timeout.
 *
 * ping() and probePorts() are the only places that touch the network and
 * can be overridden to simulate hosts.
 */
class LivenessProber {
public:
    explicit LivenessProber(const ProbeSettings& settings = ProbeSettings());
    virtual ~LivenessProber() = default;

    /**
     * Classifies an address
     * @param address: Dotted-quad IPv4 address
     * @return: Online, Standby or Offline; never Unknown
     * Throws InvalidAddressError if address is malformed. Timeouts and
     * unreachable hosts are not errors.
     */
    DeviceStatus probe(const std::string& address);

    const ProbeSettings& getSettings() const { return settings; }

protected:
    /**
     * Sends one ICMP echo request and waits for the reply
     * @return: true if an echo reply from address arrived within timeout_ms
     */
    virtual bool ping(uint32_t address, int timeout_ms);

    /**
     * Attempts TCP connections to all ports in parallel
     * @return: true if any connection completed within timeout_ms
     */
    virtual bool probePorts(uint32_t address, const std::vector<uint16_t>& ports, int timeout_ms);

private:
    ProbeSettings settings;
};
