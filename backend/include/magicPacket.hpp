//this header file defines the Wake-on-LAN magic packet payload
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "networkTypes.hpp"

// Standard Wake-on-LAN destination port (discard service)
constexpr uint16_t WOL_DEFAULT_PORT = 9;

struct MagicPacket {
	static constexpr size_t SYNC_LENGTH = 6;
	static constexpr size_t MAC_REPETITIONS = 16;
	static constexpr size_t SIZE = SYNC_LENGTH + MAC_REPETITIONS * 6;   // 102 bytes

	// 6 x 0xFF followed by the MAC repeated 16 times
	static std::vector<uint8_t> encode(const MacAddress& mac);

	// Throws InvalidMACError unless octets holds exactly 6 bytes
	static std::vector<uint8_t> encode(const std::vector<uint8_t>& octets);

	// Throws InvalidMACError if text is not a MAC address
	static std::vector<uint8_t> encode(const std::string& mac_text);
};
