#pragma once

#include "core/services/IPingService.hpp"
#include "core/services/ISnmpService.hpp"
#include "core/types/UpsStatus.hpp"
#include "infrastructure/mib/MibResolver.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apcups::infra {

/**
 * @brief Classes of failure recorded on a UpsClient.
 */
enum class UpsErrorKind : int {
    Configuration, ///< No hostname, unreadable MIB or undefined object name
    Resolution,    ///< Hostname could not be resolved
    Unreachable,   ///< Reachability check got no reply
    Transport,     ///< SNMP request could not be sent
    Query          ///< No usable response from the agent
};

/**
 * @brief An error recorded on a UpsClient.
 */
struct UpsError {
    UpsErrorKind kind{UpsErrorKind::Configuration};
    std::string message;

    /**
     * @brief Checks whether a later query() may clear this error.
     */
    [[nodiscard]] bool isPermanent() const {
        return kind == UpsErrorKind::Configuration || kind == UpsErrorKind::Resolution ||
               kind == UpsErrorKind::Unreachable;
    }

    bool operator==(const UpsError& other) const = default;
};

/**
 * @brief Converts an error kind to its string representation.
 */
std::string upsErrorKindToString(UpsErrorKind kind);

/**
 * @brief Session options of a UpsClient.
 */
struct UpsClientOptions {
    std::string community{"public"};                     ///< SNMP community string
    uint16_t port{161};                                  ///< Agent UDP port
    core::SnmpVersion version{core::SnmpVersion::V1};    ///< Protocol version
    std::string mibPath{MibResolver::DEFAULT_MIB_PATH};  ///< PowerNet MIB file
};

/**
 * @brief Handle to one APC UPS reachable over SNMP.
 *
 * The hostname is resolved once, at construction. The first accessor call
 * runs a query if none has run yet; later calls read the cached status
 * until query() is called again. Errors are recorded on the handle and
 * make every accessor return std::nullopt. Configuration, resolution and
 * reachability errors are permanent; transport and query errors are
 * cleared by a later successful query().
 *
 * @note Not thread-safe.
 */
class UpsClient {
public:
    /**
     * @brief Creates a handle and resolves the hostname.
     * @param hostname UPS hostname or IPv4 address.
     * @param snmp SNMP transport used by query().
     * @param options Community, port and MIB location.
     * @param ping ICMP service for checkReachable(); a PingService is
     *             created on demand if null.
     * @throws std::invalid_argument if snmp is null.
     */
    UpsClient(std::string hostname,
              std::shared_ptr<core::ISnmpService> snmp,
              UpsClientOptions options = {},
              std::shared_ptr<core::IPingService> ping = nullptr);

    /**
     * @brief Fetches all UPS attributes and replaces the cached status.
     * @return True on success. Does nothing and returns false if the handle
     *         holds a permanent error.
     */
    bool query();

    /**
     * @brief Sends one ICMP echo to the resolved address.
     * @param timeout Time to wait for the reply.
     * @return True if the UPS answered. On failure a permanent
     *         UpsErrorKind::Unreachable error is recorded.
     */
    bool checkReachable(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    /** @name Error state
     *  @{ */
    [[nodiscard]] bool error() const { return error_.has_value(); }
    [[nodiscard]] std::string errorMessage() const { return error_ ? error_->message : ""; }
    [[nodiscard]] const std::optional<UpsError>& lastError() const { return error_; }
    /** @} */

    /** @name Query state
     *  @{ */
    [[nodiscard]] bool isQueried() const { return lastQuery_.has_value(); }
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> lastQuery() const {
        return lastQuery_;
    }
    /** @} */

    /** @name Identity (never trigger a query)
     *  @{ */
    [[nodiscard]] std::optional<std::string> hostname() const;
    [[nodiscard]] std::optional<std::string> address() const;
    /** @} */

    /** @name Derived values
     *  Each runs the first query if needed.
     *  @{ */
    std::optional<bool> onBattery();
    std::optional<bool> needsNewBattery();
    std::optional<std::chrono::seconds> runtime();
    std::optional<double> charge(); ///< Fraction, 0.87 for 87%
    std::optional<double> load();   ///< Fraction of rated output
    std::optional<std::string> model();
    std::optional<std::string> serial();
    std::optional<std::string> name();
    std::optional<int64_t> temperature(); ///< Degrees Celsius
    std::optional<std::string> firmwareRevision();
    std::optional<std::string> birthday(); ///< Manufacture date, YYYY-MM-DD
    std::optional<std::string> lastBatteryReplacement();
    /** @} */

    /**
     * @brief Returns a copy of the decoded status.
     */
    std::optional<core::UpsStatus> status();

    /**
     * @brief Returns the values of the last query before decoding.
     */
    [[nodiscard]] const core::RawStatus& rawStatus() const { return raw_; }

private:
    void resolveAddress();
    bool loadObjectIds();
    bool ensureQueried();
    void setError(UpsErrorKind kind, std::string message);

    std::optional<std::string> text(const char* attribute);
    std::optional<std::string> date(const char* attribute);
    std::optional<double> percentage(const char* attribute);

    std::string hostname_;
    std::string address_;
    UpsClientOptions options_;
    std::shared_ptr<core::ISnmpService> snmp_;
    std::shared_ptr<core::IPingService> ping_;

    std::vector<std::string> objectIds_; ///< Numeric OIDs in query order
    std::optional<UpsError> error_;
    std::optional<std::chrono::system_clock::time_point> lastQuery_;
    core::RawStatus raw_;
    core::UpsStatus status_;
};

} // namespace apcups::infra
