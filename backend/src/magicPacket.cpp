#include "magicPacket.hpp"
#include "errors.hpp"
#include <algorithm>

/**
 * Build the magic packet for a MAC address
 * A NIC armed for Wake-on-LAN scans every frame for the 0xFF sync stream
 * followed by its own address 16 times; nothing else in the payload matters
 */
std::vector<uint8_t> MagicPacket::encode(const MacAddress& mac) {
	std::vector<uint8_t> payload;
	payload.reserve(SIZE);

	payload.insert(payload.end(), SYNC_LENGTH, 0xFF);
	for (size_t i = 0; i < MAC_REPETITIONS; i++) {
		payload.insert(payload.end(), mac.begin(), mac.end());
	}

	return payload;
}

std::vector<uint8_t> MagicPacket::encode(const std::vector<uint8_t>& octets) {
	if (octets.size() != 6) {
		throw InvalidMACError("MAC address must be 6 octets, got " + std::to_string(octets.size()));
	}

	MacAddress mac;
	std::copy(octets.begin(), octets.end(), mac.begin());
	return encode(mac);
}

std::vector<uint8_t> MagicPacket::encode(const std::string& mac_text) {
	return encode(parseMac(mac_text));
}
