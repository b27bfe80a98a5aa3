/**
 * @file SnmpTypes.hpp
 * @brief SNMP value types and session configuration.
 *
 * This file defines the types exchanged with an SNMP agent: variable
 * bindings, query results and the per-device session configuration.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apcups::core {

/**
 * @brief Supported SNMP protocol versions.
 */
enum class SnmpVersion : int {
    V1 = 1, ///< SNMP version 1 (community-based)
    V2c = 2 ///< SNMP version 2c (community-based with v2 exceptions)
};

/**
 * @brief SNMP data types as defined in RFC 2578.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Gauge32 = 5,          ///< 32-bit gauge (can increase or decrease)
    TimeTicks = 6,        ///< Hundredths of a second
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Unknown = 99          ///< Unknown data type
};

/**
 * @brief SNMP variable binding (OID + value pair).
 */
struct SnmpVarBind {
    std::string oid;                          ///< Object identifier
    SnmpDataType type{SnmpDataType::Unknown}; ///< Data type of the value
    std::string value;                        ///< String representation of the value
    std::optional<int64_t> intValue;          ///< Integer value (INTEGER)
    std::optional<uint64_t> counterValue;     ///< Counter/gauge/ticks value

    /**
     * @brief Checks whether the binding carries no value.
     * @return True for NULL and the v2 exception types.
     */
    [[nodiscard]] bool isException() const {
        return type == SnmpDataType::Null || type == SnmpDataType::NoSuchObject ||
               type == SnmpDataType::NoSuchInstance || type == SnmpDataType::EndOfMibView;
    }

    bool operator==(const SnmpVarBind& other) const = default;
};

/**
 * @brief Failure classes of an SNMP exchange.
 */
enum class SnmpFailure : int {
    None = 0,          ///< Exchange completed
    Transport = 1,     ///< Address not resolvable, socket not opened or request not sent
    Timeout = 2,       ///< No matching response within the retry budget
    Protocol = 3,      ///< Response carried an SNMP error status
    InvalidRequest = 4 ///< Request could not be encoded (bad OID)
};

/**
 * @brief Result of an SNMP query operation.
 *
 * Contains the response from an SNMP GET or GET-NEXT operation. Varbinds
 * are in the order of the request.
 */
struct SnmpResult {
    std::chrono::system_clock::time_point timestamp; ///< When the query was performed
    SnmpVersion version{SnmpVersion::V1};            ///< SNMP version used
    std::vector<SnmpVarBind> varbinds;               ///< Variable bindings in the response
    std::chrono::microseconds responseTime{0};       ///< Time taken for the query
    int attempts{0};                                 ///< Requests sent, retries included
    bool success{false};                             ///< Whether the query succeeded
    SnmpFailure failure{SnmpFailure::None};          ///< Failure class if not successful
    std::string errorMessage;                        ///< Error message if query failed
    int errorStatus{0};                              ///< SNMP error status (0 = noError)
    int errorIndex{0};                               ///< Index of varbind that caused error

    /**
     * @brief Converts response time to milliseconds.
     * @return Response time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    bool operator==(const SnmpResult& other) const = default;
};

/**
 * @brief Session parameters for one SNMP agent.
 *
 * The timeout and retry defaults give a worst case of about one second
 * per request.
 */
struct SnmpDeviceConfig {
    SnmpVersion version{SnmpVersion::V1}; ///< SNMP version to use
    std::string community{"public"};      ///< Community string
    uint16_t port{161};                   ///< SNMP port
    int timeoutMs{500};                   ///< Per-attempt timeout in milliseconds
    int retries{1};                       ///< Additional attempts after the first

    bool operator==(const SnmpDeviceConfig& other) const = default;
};

/**
 * @brief Converts an SNMP version to its string representation.
 * @param version The SNMP version to convert.
 * @return String representation ("v1" or "v2c").
 */
inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "v1";
        case SnmpVersion::V2c: return "v2c";
    }
    return "unknown";
}

/**
 * @brief Parses a string to get the corresponding SNMP version.
 * @param str The string to parse (e.g., "v1", "v2c").
 * @return The corresponding SnmpVersion (defaults to V1).
 */
inline SnmpVersion snmpVersionFromString(const std::string& str) {
    if (str == "v2c" || str == "2c" || str == "2") return SnmpVersion::V2c;
    return SnmpVersion::V1;
}

/**
 * @brief Converts an SNMP data type to its string representation.
 * @param type The data type to convert.
 * @return String representation (e.g., "INTEGER", "OCTET STRING").
 */
inline std::string snmpDataTypeToString(SnmpDataType type) {
    switch (type) {
        case SnmpDataType::Integer: return "INTEGER";
        case SnmpDataType::OctetString: return "OCTET STRING";
        case SnmpDataType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case SnmpDataType::IpAddress: return "IpAddress";
        case SnmpDataType::Counter32: return "Counter32";
        case SnmpDataType::Gauge32: return "Gauge32";
        case SnmpDataType::TimeTicks: return "TimeTicks";
        case SnmpDataType::Counter64: return "Counter64";
        case SnmpDataType::Null: return "Null";
        case SnmpDataType::NoSuchObject: return "noSuchObject";
        case SnmpDataType::NoSuchInstance: return "noSuchInstance";
        case SnmpDataType::EndOfMibView: return "endOfMibView";
        case SnmpDataType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace apcups::core
