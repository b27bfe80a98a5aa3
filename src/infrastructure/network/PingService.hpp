#pragma once

#include "core/services/IPingService.hpp"

#include <cstdint>
#include <vector>

namespace apcups::infra {

/**
 * @brief ICMP ping service for host reachability testing.
 *
 * Sends a single ICMP echo request over a raw socket and waits for the
 * matching echo reply. Implements the core::IPingService interface.
 *
 * @note On Linux, requires CAP_NET_RAW capability or root privileges.
 */
class PingService : public core::IPingService {
public:
    PingService();
    ~PingService() override = default;

    /**
     * @brief Pings an IPv4 address.
     * @param address Dotted-quad or resolvable hostname.
     * @param timeout Maximum time to wait for the reply.
     * @return PingResult with latency or error info.
     */
    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Computes the Internet checksum (RFC 1071) of a buffer.
     */
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);

    /**
     * @brief Builds a 64-byte ICMP echo request.
     * @param identifier Echo identifier.
     * @param sequence Echo sequence number.
     * @return The packet with its checksum filled in.
     */
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    uint16_t identifier_{0};
    uint16_t sequenceNumber_{0};
};

} // namespace apcups::infra
