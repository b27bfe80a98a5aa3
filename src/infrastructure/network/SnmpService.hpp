#pragma once

#include "core/services/ISnmpService.hpp"
#include "infrastructure/network/BerCodec.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace apcups::infra {

/**
 * @brief SNMP v1/v2c client for querying a single agent.
 *
 * Sends GET and GET-NEXT requests over UDP and waits for the matching
 * response. Each attempt waits up to SnmpDeviceConfig::timeoutMs and a
 * request is sent at most 1 + SnmpDeviceConfig::retries times. Responses
 * with a foreign request ID and undecodable datagrams are discarded.
 * Implements the core::ISnmpService interface.
 *
 * @note This class is non-copyable and not thread-safe.
 */
class SnmpService : public core::ISnmpService {
public:
    SnmpService();
    ~SnmpService() override = default;

    SnmpService(const SnmpService&) = delete;
    SnmpService& operator=(const SnmpService&) = delete;

    /**
     * @brief Performs an SNMP GET request.
     * @param address Target hostname or IP address.
     * @param oids Vector of numeric OID strings to query.
     * @param config SNMP session configuration.
     * @return SnmpResult with the retrieved values.
     */
    core::SnmpResult get(const std::string& address,
                         const std::vector<std::string>& oids,
                         const core::SnmpDeviceConfig& config) override;

    /**
     * @brief Performs an SNMP GET-NEXT request.
     * @param address Target hostname or IP address.
     * @param oids Vector of numeric OID strings for the GET-NEXT operation.
     * @param config SNMP session configuration.
     * @return SnmpResult with the next OID values.
     */
    core::SnmpResult getNext(const std::string& address,
                             const std::vector<std::string>& oids,
                             const core::SnmpDeviceConfig& config) override;

    /**
     * @brief Waits for one datagram on a socket driven by the given context.
     *
     * A datagram that completes as the timeout expires is still returned.
     *
     * @param io Context the socket was created on.
     * @param socket Open UDP socket.
     * @param buffer Receive buffer.
     * @param timeout Maximum time to wait.
     * @param ec Set to asio::error::timed_out on timeout, or the receive error.
     * @return Number of bytes received, or std::nullopt.
     */
    static std::optional<size_t> receiveWithTimeout(asio::io_context& io,
                                                    asio::ip::udp::socket& socket,
                                                    std::vector<uint8_t>& buffer,
                                                    std::chrono::steady_clock::duration timeout,
                                                    asio::error_code& ec);

private:
    core::SnmpResult performRequest(const std::string& address,
                                    const std::vector<std::string>& oids,
                                    const core::SnmpDeviceConfig& config,
                                    PduType pduType);

    asio::io_context ioContext_;
    int32_t requestIdCounter_{1};
};

} // namespace apcups::infra
