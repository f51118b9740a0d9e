#include <catch2/catch.hpp>

#include "errors.hpp"
#include "magicPacket.hpp"

TEST_CASE("Magic packet layout") {
    MacAddress mac = parseMac("00:11:32:AB:CD:EF");
    std::vector<uint8_t> payload = MagicPacket::encode(mac);

    REQUIRE(payload.size() == 102);
    for (size_t i = 0; i < 6; i++) {
        REQUIRE(payload[i] == 0xFF);
    }
    for (size_t rep = 0; rep < 16; rep++) {
        for (size_t i = 0; i < 6; i++) {
            REQUIRE(payload[6 + rep * 6 + i] == mac[i]);
        }
    }

    REQUIRE(MagicPacket::encode(mac) == payload);
    REQUIRE(MagicPacket::encode(std::string("00-11-32-ab-cd-ef")) == payload);
}

TEST_CASE("Broadcast and zero MACs encode like any other") {
    std::vector<uint8_t> ones = MagicPacket::encode(std::string("FF:FF:FF:FF:FF:FF"));
    REQUIRE(ones == std::vector<uint8_t>(102, 0xFF));

    std::vector<uint8_t> zeros = MagicPacket::encode(std::string("00:00:00:00:00:00"));
    REQUIRE(zeros.size() == 102);
    REQUIRE(zeros[5] == 0xFF);
    REQUIRE(zeros[6] == 0x00);
}

TEST_CASE("Encoding rejects anything but six octets") {
    REQUIRE_THROWS_AS(MagicPacket::encode(std::vector<uint8_t>{1, 2, 3, 4, 5}), InvalidMACError);
    REQUIRE_THROWS_AS(MagicPacket::encode(std::vector<uint8_t>(8, 0)), InvalidMACError);
    REQUIRE_THROWS_AS(MagicPacket::encode(std::string("00:11:22")), InvalidMACError);
    REQUIRE(MagicPacket::encode(std::vector<uint8_t>{1, 2, 3, 4, 5, 6}).size() == 102);
}
