#include <catch2/catch.hpp>

#include <set>
#include "addressSpace.hpp"
#include "errors.hpp"

TEST_CASE("A /24 interface enumerates 254 host addresses") {
    NetworkInterface iface{"eth0", "192.168.1.10", "255.255.255.0"};
    AddressRange range(iface);

    REQUIRE(range.size() == 254);
    REQUIRE(*range.begin() == "192.168.1.1");
    REQUIRE(range.cidr() == "192.168.1.0/24");

    std::set<std::string> seen;
    std::string last;
    for (auto it = range.begin(); it != range.end(); ++it) {
        seen.insert(*it);
        last = *it;
    }
    REQUIRE(seen.size() == 254);
    REQUIRE(last == "192.168.1.254");
    REQUIRE(seen.count("192.168.1.0") == 0);
    REQUIRE(seen.count("192.168.1.255") == 0);
}

TEST_CASE("Blocks of four or more drop exactly the network and broadcast addresses") {
    for (int prefix = 20; prefix <= 30; prefix++) {
        AddressRange range = AddressRange::fromCidr("10.20.0.0/" + std::to_string(prefix));
        uint64_t block = uint64_t(1) << (32 - prefix);
        INFO("prefix /" << prefix);

        REQUIRE(range.size() == block - 2);

        std::set<uint32_t> seen;
        for (auto it = range.begin(); it != range.end(); ++it) {
            seen.insert(it.address());
        }
        REQUIRE(seen.size() == block - 2);
        REQUIRE(seen.count(parseIPv4("10.20.0.0")) == 0);
        REQUIRE(seen.count(parseIPv4("10.20.0.0") + static_cast<uint32_t>(block) - 1) == 0);
    }

    REQUIRE(AddressRange::fromCidr("10.0.0.0/8").size() == 16777214);
}

TEST_CASE("Point-to-point and host routes keep every address") {
    AddressRange p2p = AddressRange::fromCidr("10.0.0.4/31");
    REQUIRE(p2p.size() == 2);
    REQUIRE(*p2p.begin() == "10.0.0.4");
    REQUIRE_FALSE(p2p.broadcastAddress());

    AddressRange host = AddressRange::fromCidr("10.0.0.9/32");
    REQUIRE(host.size() == 1);
    REQUIRE(*host.begin() == "10.0.0.9");
}

TEST_CASE("Range membership and broadcast") {
    AddressRange range = AddressRange::fromCidr("192.168.1.77/26");

    REQUIRE(range.cidr() == "192.168.1.64/26");
    REQUIRE(range.contains("192.168.1.65"));
    REQUIRE(range.contains("192.168.1.126"));
    REQUIRE_FALSE(range.contains("192.168.1.64"));
    REQUIRE_FALSE(range.contains("192.168.1.127"));
    REQUIRE_FALSE(range.contains("garbage"));
    REQUIRE(range.broadcastAddress() == std::string("192.168.1.127"));
    REQUIRE(formatIPv4(range.at(0)) == "192.168.1.65");
}

TEST_CASE("Invalid interfaces are rejected before enumeration") {
    REQUIRE_THROWS_AS(AddressRange(NetworkInterface{"eth0", "192.168.1.300", "255.255.255.0"}),
                      InvalidInterfaceError);
    REQUIRE_THROWS_AS(AddressRange(NetworkInterface{"eth0", "192.168.1.10", "255.0.255.0"}),
                      InvalidInterfaceError);
    REQUIRE_THROWS_AS(AddressRange::fromCidr("192.168.1.0"), InvalidInterfaceError);
    REQUIRE_THROWS_AS(AddressRange::fromCidr("192.168.1.0/33"), InvalidInterfaceError);
    REQUIRE_THROWS_AS(AddressRange::fromCidr("192.168.1.0/x"), InvalidInterfaceError);
}

TEST_CASE("Interface and CIDR construction agree") {
    AddressRange from_interface(NetworkInterface{"eth0", "10.20.30.40", "255.255.252.0"});
    AddressRange from_cidr = AddressRange::fromCidr("10.20.28.0/22");

    REQUIRE(from_interface.cidr() == "10.20.28.0/22");
    REQUIRE(from_interface.prefixLength() == 22);
    REQUIRE(from_interface.size() == from_cidr.size());
    REQUIRE(*from_interface.begin() == "10.20.28.1");
    REQUIRE(from_interface.broadcastAddress() == from_cidr.broadcastAddress());
}
