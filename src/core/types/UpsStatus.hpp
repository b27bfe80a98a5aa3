/**
 * @file UpsStatus.hpp
 * @brief Raw and decoded UPS status records.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace apcups::core {

/**
 * @brief Value of a single UPS attribute.
 *
 * std::monostate stands for a value the agent did not supply.
 */
using AttributeValue =
    std::variant<std::monostate, int64_t, std::string, std::chrono::year_month_day>;

/**
 * @brief Attribute values exactly as returned by one SNMP query.
 */
using RawStatus = std::map<std::string, AttributeValue>;

/**
 * @brief A value the decoder could not interpret.
 */
struct DecodeWarning {
    std::string attribute; ///< Attribute that was left undecoded
    std::string message;   ///< Human readable description

    bool operator==(const DecodeWarning& other) const = default;
};

/**
 * @brief Decoded UPS status.
 *
 * Same key space as RawStatus. Enumerated attributes hold their symbolic
 * name and date attributes hold a calendar date; everything else is the
 * raw value.
 */
struct UpsStatus {
    std::map<std::string, AttributeValue> values; ///< Decoded attribute values
    std::vector<DecodeWarning> warnings;          ///< Values left undecoded

    /**
     * @brief Checks whether an attribute is present with a value.
     * @param name Attribute name.
     * @return True if present and not std::monostate.
     */
    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @brief Gets the value of an attribute.
     * @param name Attribute name.
     * @return The value, or std::monostate if absent.
     */
    [[nodiscard]] AttributeValue value(const std::string& name) const;

    [[nodiscard]] std::optional<int64_t> integer(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> text(const std::string& name) const;
    [[nodiscard]] std::optional<std::chrono::year_month_day> date(const std::string& name) const;

    bool operator==(const UpsStatus& other) const = default;
};

/**
 * @brief Formats a calendar date as YYYY-MM-DD.
 */
std::string formatDate(const std::chrono::year_month_day& date);

/**
 * @brief Renders an attribute value for display.
 * @return Empty string for std::monostate.
 */
std::string attributeValueToString(const AttributeValue& value);

} // namespace apcups::core
