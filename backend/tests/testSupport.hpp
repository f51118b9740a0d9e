#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "castDispatcher.hpp"
#include "livenessProber.hpp"
#include "macResolver.hpp"

/**
 * Scratch directory removed with everything in it on destruction
 */
class TempDir {
private:
    std::filesystem::path path;

public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("wolcaster-test-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
    std::string file(const std::string& name) const { return (path / name).string(); }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(file(name), std::ios::binary);
        out << content;
    }

    std::string read(const std::string& name) const {
        std::ifstream in(file(name), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

/**
 * Simulated network for the liveness probe
 * Every address is offline unless listed; listed sets must not change
 * while a scan is running
 */
class FakeProber : public LivenessProber {
public:
    std::set<uint32_t> online;
    std::set<uint32_t> standby;
    std::set<uint32_t> failing;
    std::chrono::milliseconds latency{0};

    std::atomic<int> probes{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    FakeProber() : LivenessProber(ProbeSettings()) {}

    void setOnline(const std::string& ip) { online.insert(parseIPv4(ip)); }
    void setStandby(const std::string& ip) { standby.insert(parseIPv4(ip)); }
    void setFailing(const std::string& ip) { failing.insert(parseIPv4(ip)); }

protected:
    bool ping(uint32_t address, int) override {
        probes++;
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {}

        if (latency.count() > 0) std::this_thread::sleep_for(latency);
        in_flight--;

        if (failing.count(address)) throw std::runtime_error("probe socket exploded");
        return online.count(address) > 0;
    }

    bool probePorts(uint32_t address, const std::vector<uint16_t>&, int) override {
        return standby.count(address) > 0;
    }
};

/**
 * Neighbor table and reverse DNS held in memory
 */
class FakeResolver : public MacResolver {
public:
    std::map<std::string, MacAddress> neighbors;
    std::map<std::string, std::string> hostnames;

    FakeResolver() : MacResolver(0) {}

    std::optional<std::string> lookupHostname(const std::string& address) override {
        auto it = hostnames.find(address);
        if (it == hostnames.end()) return std::nullopt;
        return it->second;
    }

protected:
    std::optional<MacAddress> lookupNeighbor(const std::string& address) override {
        auto it = neighbors.find(address);
        if (it == neighbors.end()) return std::nullopt;
        return it->second;
    }

    void stimulate(uint32_t) override {}
};

/**
 * Records every datagram instead of sending it
 */
class FakeDispatcher : public CastDispatcher {
public:
    std::set<std::string> unreachable;
    std::chrono::milliseconds latency{0};

    std::mutex sent_mutex;
    std::vector<std::string> destinations;
    std::vector<uint16_t> ports;
    std::vector<std::vector<uint8_t>> payloads;

    explicit FakeDispatcher(const CastSettings& settings = CastSettings()) : CastDispatcher(settings) {}

protected:
    bool sendPacket(const std::string& destination, const std::vector<uint8_t>& payload,
                    uint16_t port, std::string& error) override {
        if (latency.count() > 0) std::this_thread::sleep_for(latency);

        std::lock_guard<std::mutex> lock(sent_mutex);
        if (unreachable.count(destination)) {
            error = "sendto: Network is unreachable";
            return false;
        }
        destinations.push_back(destination);
        ports.push_back(port);
        payloads.push_back(payload);
        return true;
    }
};
