#include "infrastructure/network/SnmpService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <random>

namespace apcups::infra {

namespace {

// SNMP error statuses
constexpr int SNMP_ERR_NO_ERROR = 0;
constexpr int SNMP_ERR_TOO_BIG = 1;
constexpr int SNMP_ERR_NO_SUCH_NAME = 2;
constexpr int SNMP_ERR_BAD_VALUE = 3;
constexpr int SNMP_ERR_READ_ONLY = 4;
constexpr int SNMP_ERR_GEN_ERR = 5;

constexpr size_t kMaxDatagramSize = 65535;

std::string snmpErrorToString(int errorStatus) {
    switch (errorStatus) {
        case SNMP_ERR_NO_ERROR: return "No error";
        case SNMP_ERR_TOO_BIG: return "Response too big";
        case SNMP_ERR_NO_SUCH_NAME: return "No such name";
        case SNMP_ERR_BAD_VALUE: return "Bad value";
        case SNMP_ERR_READ_ONLY: return "Read only";
        case SNMP_ERR_GEN_ERR: return "General error";
        default: return "Unknown error";
    }
}

void fail(core::SnmpResult& result, core::SnmpFailure failure, std::string message) {
    result.success = false;
    result.failure = failure;
    result.errorMessage = std::move(message);
}

} // anonymous namespace

SnmpService::SnmpService() {
    // Initialize request ID with random value for security
    std::random_device rd;
    requestIdCounter_ = static_cast<int32_t>(rd() & 0x7FFFFFFF);
    spdlog::debug("SnmpService initialized");
}

core::SnmpResult SnmpService::get(const std::string& address,
                                  const std::vector<std::string>& oids,
                                  const core::SnmpDeviceConfig& config) {
    return performRequest(address, oids, config, PduType::GetRequest);
}

core::SnmpResult SnmpService::getNext(const std::string& address,
                                      const std::vector<std::string>& oids,
                                      const core::SnmpDeviceConfig& config) {
    return performRequest(address, oids, config, PduType::GetNextRequest);
}

core::SnmpResult SnmpService::performRequest(const std::string& address,
                                             const std::vector<std::string>& oids,
                                             const core::SnmpDeviceConfig& config,
                                             PduType pduType) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.version = config.version;

    auto startTime = std::chrono::steady_clock::now();
    auto elapsed = [&startTime]() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);
    };

    // Build SNMP request
    SnmpMessage request;
    request.version = config.version;
    request.community = config.community;
    request.pduType = pduType;
    request.requestId = requestIdCounter_;
    requestIdCounter_ = (requestIdCounter_ == std::numeric_limits<int32_t>::max())
                            ? 1
                            : requestIdCounter_ + 1;
    for (const auto& oid : oids) {
        core::SnmpVarBind varbind;
        varbind.oid = oid;
        varbind.type = core::SnmpDataType::Null;
        request.varbinds.push_back(varbind);
    }

    std::vector<uint8_t> packet;
    try {
        packet = BerCodec::encodeMessage(request);
    } catch (const std::exception& e) {
        fail(result, core::SnmpFailure::InvalidRequest,
             std::string("Failed to encode request: ") + e.what());
        return result;
    }

    // Resolve address
    asio::error_code ec;
    asio::ip::udp::resolver resolver(ioContext_);
    auto endpoints =
        resolver.resolve(asio::ip::udp::v4(), address, std::to_string(config.port), ec);
    if (ec || endpoints.empty()) {
        fail(result, core::SnmpFailure::Transport, "Failed to resolve address: " + address);
        return result;
    }
    auto endpoint = endpoints.begin()->endpoint();

    // Create UDP socket
    asio::ip::udp::socket socket(ioContext_);
    socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        fail(result, core::SnmpFailure::Transport, "Failed to open socket: " + ec.message());
        return result;
    }

    std::vector<uint8_t> recvBuffer(kMaxDatagramSize);
    auto timeout = std::chrono::milliseconds(std::max(config.timeoutMs, 1));
    int maxAttempts = 1 + std::max(config.retries, 0);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;

        socket.send_to(asio::buffer(packet), endpoint, 0, ec);
        if (ec) {
            fail(result, core::SnmpFailure::Transport, "Failed to send request: " + ec.message());
            return result;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= std::chrono::steady_clock::duration::zero()) {
                break;
            }

            auto received = receiveWithTimeout(ioContext_, socket, recvBuffer, remaining, ec);
            if (!received) {
                if (ec != asio::error::timed_out) {
                    spdlog::debug("SNMP receive error from {}: {}", address, ec.message());
                }
                break;
            }

            SnmpMessage response;
            try {
                response = BerCodec::decodeMessage(
                    std::vector<uint8_t>(recvBuffer.begin(), recvBuffer.begin() + *received));
            } catch (const std::exception& e) {
                spdlog::debug("Discarding malformed SNMP datagram from {}: {}", address, e.what());
                continue;
            }

            if (response.pduType != PduType::GetResponse ||
                response.requestId != request.requestId) {
                spdlog::debug("Discarding unrelated SNMP response (request-id {})",
                              response.requestId);
                continue;
            }

            result.responseTime = elapsed();
            result.errorStatus = response.errorStatus;
            result.errorIndex = response.errorIndex;

            if (response.errorStatus != SNMP_ERR_NO_ERROR) {
                fail(result, core::SnmpFailure::Protocol, snmpErrorToString(response.errorStatus));
                return result;
            }

            result.varbinds = std::move(response.varbinds);
            result.success = true;
            spdlog::debug("SNMP response from {} with {} varbinds in {:.2f}ms", address,
                          result.varbinds.size(), result.responseTimeMs());
            return result;
        }

        spdlog::debug("SNMP request {} to {} timed out (attempt {}/{})", request.requestId,
                      address, attempt, maxAttempts);
    }

    result.responseTime = elapsed();
    fail(result, core::SnmpFailure::Timeout, "Request timed out");
    return result;
}

std::optional<size_t> SnmpService::receiveWithTimeout(asio::io_context& io,
                                                      asio::ip::udp::socket& socket,
                                                      std::vector<uint8_t>& buffer,
                                                      std::chrono::steady_clock::duration timeout,
                                                      asio::error_code& ec) {
    asio::ip::udp::endpoint sender;
    asio::error_code receiveError;
    size_t length = 0;

    socket.async_receive_from(asio::buffer(buffer), sender,
                              [&receiveError, &length](const asio::error_code& error, size_t n) {
                                  receiveError = error;
                                  length = n;
                              });

    io.restart();
    io.run_for(timeout);

    // Still waiting: cancel and let the handler run. The receive may have
    // completed just before the cancel, in which case the datagram is kept.
    if (!io.stopped()) {
        socket.cancel();
        io.restart();
        io.run();
        if (receiveError) {
            ec = asio::error::timed_out;
            return std::nullopt;
        }
        ec.clear();
        return length;
    }

    ec = receiveError;
    if (ec) {
        return std::nullopt;
    }
    return length;
}

} // namespace apcups::infra
