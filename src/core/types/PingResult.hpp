/**
 * @file PingResult.hpp
 * @brief Result of an ICMP reachability check.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace apcups::core {

/**
 * @brief Result of a single ICMP ping operation.
 */
struct PingResult {
    std::chrono::system_clock::time_point timestamp; ///< When the ping was performed
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};     ///< Whether the ping received a response
    std::optional<int> ttl;  ///< Time-to-live from the response (if available)
    std::string errorMessage; ///< Error message if the ping failed

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace apcups::core
