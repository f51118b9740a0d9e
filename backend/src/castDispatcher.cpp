#include "castDispatcher.hpp"
#include "logging.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <optional>
#include <sys/socket.h>
#include <unistd.h>

CastDispatcher::CastDispatcher(const CastSettings& settings) : settings(settings) {}

/**
 * Sends one datagram on a fresh socket
 */
bool CastDispatcher::sendPacket(const std::string& destination, const std::vector<uint8_t>& payload,
                                uint16_t port, std::string& error) {
	// SOCK_DGRAM: UDP - Wake-on-LAN is fire and forget, nothing ever answers
	int fd = socket(AF_INET, SOCK_DGRAM, 0);
	if (fd < 0) {
		error = std::string("socket: ") + strerror(errno);
		return false;
	}

	// SO_BROADCAST: required when destination is a subnet broadcast address
	int broadcast_enable = 1;
	if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &broadcast_enable, sizeof(broadcast_enable)) < 0) {
		error = std::string("setsockopt(SO_BROADCAST): ") + strerror(errno);
		close(fd);
		return false;
	}

	struct sockaddr_in target_addr;
	std::memset(&target_addr, 0, sizeof(target_addr));
	target_addr.sin_family = AF_INET;
	target_addr.sin_port = htons(port);
	if (inet_pton(AF_INET, destination.c_str(), &target_addr.sin_addr) <= 0) {
		error = "invalid destination address " + destination;
		close(fd);
		return false;
	}

	ssize_t sent = sendto(fd, payload.data(), payload.size(), 0,
	                      (struct sockaddr*)&target_addr, sizeof(target_addr));
	if (sent != static_cast<ssize_t>(payload.size())) {
		error = std::string("sendto: ") + (sent < 0 ? strerror(errno) : "short write");
		close(fd);
		return false;
	}

	close(fd);
	return true;
}

CastSummary CastDispatcher::cast(const std::vector<ResolvedTarget>& targets, const CancellationToken& token) {
	auto start_time = std::chrono::steady_clock::now();

	CastSummary summary;
	summary.total = targets.size();
	LOG_INFO("Casting magic packets to ", summary.total, " targets on UDP port ", settings.port);

	size_t next_index = 0;
	auto next = [&]() -> std::optional<size_t> {
		if (next_index >= targets.size()) return std::nullopt;
		return next_index++;
	};

	std::mutex results_mutex;

	auto work = [&](const size_t& index) {
		const ResolvedTarget& target = targets[index];
		std::string error;
		bool ok = false;

		try {
			std::vector<uint8_t> payload = MagicPacket::encode(target.mac);
			std::string destination = (settings.directed_broadcast && target.broadcast_address)
				? *target.broadcast_address
				: target.ip_address;
			ok = sendPacket(destination, payload, settings.port, error);
		} catch (const std::exception& e) {
			error = e.what();
		}

		std::lock_guard<std::mutex> lock(results_mutex);
		if (ok) {
			summary.sent++;
			LOG_DEBUG("Magic packet for ", formatMac(target.mac), " sent to ", target.ip_address);
		} else {
			summary.failed++;
			summary.failures.push_back({target, error});
			LOG_WARNING("Cast to ", target.ip_address, " (", formatMac(target.mac), ") failed: ", error);
		}

		if (progress_callback) {
			try {
				progress_callback({target, ok, summary.sent + summary.failed, summary.total});
			} catch (const std::exception& e) {
				LOG_WARNING("Cast observer raised: ", e.what());
			}
		}
	};

	if (!targets.empty()) {
		size_t workers = std::min<size_t>(std::max<size_t>(settings.concurrency, 1), targets.size());
		runBounded<size_t>(workers, token, next, work);
	}

	summary.cancelled = token.isCancelled();
	summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start_time);

	LOG_INFO("Cast ", summary.cancelled ? "stopped" : "complete", ": ", summary.sent, " sent, ",
	         summary.failed, " failed, ", summary.skipped(), " skipped of ", summary.total);
	return summary;
}
