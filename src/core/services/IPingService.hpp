/**
 * @file IPingService.hpp
 * @brief Interface for the ICMP ping service.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <string>

namespace apcups::core {

/**
 * @brief Interface for ICMP reachability checks.
 *
 * @note On Linux, ICMP ping requires CAP_NET_RAW capability or root privileges.
 */
class IPingService {
public:
    virtual ~IPingService() = default;

    /**
     * @brief Sends one echo request and waits for the reply.
     * @param address IPv4 address to ping.
     * @param timeout Maximum time to wait for a response.
     * @return The ping result.
     */
    virtual PingResult ping(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace apcups::core
