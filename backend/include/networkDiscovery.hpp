#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "device.hpp"
#include "livenessProber.hpp"
#include "macResolver.hpp"
#include "ouiTable.hpp"
#include "workerPool.hpp"

/**
 * Progress after one address finished, in completion order
 */
struct ScanProgress {
    std::string interface_name;
    std::string ip_address;     // Address that just completed
    size_t completed;
    size_t total;

    double fraction() const {
        return total == 0 ? 1.0 : static_cast<double>(completed) / static_cast<double>(total);
    }
};

// An address whose probe raised instead of classifying
struct ScanFailure {
    std::string interface_name;
    std::string ip_address;
    std::string reason;
};

/**
 * Terminal report of a scan, produced on completion and on cancellation
 */
struct ScanSummary {
    size_t total = 0;           // Addresses enumerated
    size_t completed = 0;       // Addresses that finished (classified or failed)
    size_t online = 0;
    size_t standby = 0;
    size_t offline = 0;
    std::vector<ScanFailure> failures;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};

    size_t succeeded() const { return online + standby + offline; }
    size_t failed() const { return failures.size(); }
};

struct ScanOptions {
    size_t concurrency = 50;
    bool resolve_hostnames = true;
};

/**
 * NetworkDiscovery sweeps the subnets of one or more interfaces
 *
 * Every host address is an independent unit of work: probe, then (if the
 * host answered) resolve its MAC, vendor and hostname. Units run on at most
 * `concurrency` workers; results are reported through the callbacks in
 * completion order, one device update and one progress event per address.
 * Both callbacks are invoked from worker threads, but never concurrently.
 */
class NetworkDiscovery {
private:
    LivenessProber& prober;
    MacResolver& resolver;
    const OuiTable& vendors;
    ScanOptions options;

    // Callback for every classified address
    std::function<void(const Device&)> device_found_callback;

    // Callback after every completed address
    std::function<void(const ScanProgress&)> progress_callback;

    /**
     * Probes and identifies a single address
     * @param iface: Interface the address belongs to
     * @param address: Host byte order IPv4 address
     * @return: Fully populated Device for this observation
     */
    Device scanAddress(const NetworkInterface& iface, uint32_t address);

public:
    NetworkDiscovery(LivenessProber& prober, MacResolver& resolver, const OuiTable& vendors,
                     const ScanOptions& options = ScanOptions());

    /**
     * Runs a scan to completion or cancellation
     * @param interfaces: Interfaces whose subnets are swept, in order
     * @param token: Checked before every address dispatch
     * @return: Summary with per-status counts, failures and elapsed time
     * Throws InvalidInterfaceError before any probing if an interface's
     * address or mask cannot be parsed
     */
    ScanSummary scan(const std::vector<NetworkInterface>& interfaces, const CancellationToken& token);

    void setDeviceFoundCallback(std::function<void(const Device&)> callback) {
        device_found_callback = callback;
    }

    void setProgressCallback(std::function<void(const ScanProgress&)> callback) {
        progress_callback = callback;
    }
};

/**
 * Lists the IPv4 addresses configured on local interfaces
 * Loopback and down interfaces are skipped. An interface with several
 * addresses appears once per address.
 */
std::vector<NetworkInterface> listInterfaces();
