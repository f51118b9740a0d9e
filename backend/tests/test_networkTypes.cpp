#include <catch2/catch.hpp>

#include "errors.hpp"
#include "networkTypes.hpp"

TEST_CASE("IPv4 text is parsed strictly") {
    REQUIRE(parseIPv4("192.168.1.10") == 0xC0A8010Au);
    REQUIRE(formatIPv4(0xC0A8010Au) == "192.168.1.10");

    REQUIRE_THROWS_AS(parseIPv4("192.168.1"), InvalidAddressError);
    REQUIRE_THROWS_AS(parseIPv4("192.168.1.256"), InvalidAddressError);
    REQUIRE_THROWS_AS(parseIPv4("host.local"), InvalidAddressError);

    uint32_t out = 0;
    REQUIRE_FALSE(tryParseIPv4("", out));
}

TEST_CASE("Netmasks must be contiguous") {
    REQUIRE(netmaskToPrefix("255.255.255.0") == 24);
    REQUIRE(netmaskToPrefix("255.255.240.0") == 20);
    REQUIRE(netmaskToPrefix("255.255.255.255") == 32);
    REQUIRE(netmaskToPrefix("0.0.0.0") == 0);

    REQUIRE_THROWS_AS(netmaskToPrefix("255.0.255.0"), InvalidInterfaceError);
    REQUIRE_THROWS_AS(netmaskToPrefix("255.255.255"), InvalidInterfaceError);
}

TEST_CASE("MAC addresses are normalized to upper case colon form") {
    REQUIRE(formatMac(parseMac("0:3e:e1:b7:57:54")) == "00:3E:E1:B7:57:54");
    REQUIRE(formatMac(parseMac("00-50-56-c0-00-08")) == "00:50:56:C0:00:08");
    REQUIRE(formatMac(parseMac("b827ebAABBCC")) == "B8:27:EB:AA:BB:CC");
    REQUIRE(formatMac(parseMac("FF:FF:FF:FF:FF:FF")) == "FF:FF:FF:FF:FF:FF");
}

TEST_CASE("Malformed MAC addresses are rejected") {
    REQUIRE_THROWS_AS(parseMac("00:11:22:33:44"), InvalidMACError);
    REQUIRE_THROWS_AS(parseMac("00:11:22:33:44:55:66"), InvalidMACError);
    REQUIRE_THROWS_AS(parseMac("00:11:22:33:44:5g"), InvalidMACError);
    REQUIRE_THROWS_AS(parseMac("000:11:22:33:44:55"), InvalidMACError);
    REQUIRE_THROWS_AS(parseMac("00::22:33:44:55"), InvalidMACError);
    REQUIRE_THROWS_AS(parseMac(""), InvalidMACError);
}

TEST_CASE("Interface exposes its subnet") {
    NetworkInterface iface{"eth0", "192.168.1.10", "255.255.255.0"};

    REQUIRE(iface.prefixLength() == 24);
    REQUIRE(iface.networkAddress() == "192.168.1.0");
    REQUIRE(iface.broadcastAddress() == "192.168.1.255");
    REQUIRE(iface.cidr() == "192.168.1.0/24");

    NetworkInterface broken{"eth1", "not-an-ip", "255.255.255.0"};
    REQUIRE_THROWS_AS(broken.cidr(), InvalidInterfaceError);
}
