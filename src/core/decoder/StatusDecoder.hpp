/**
 * @file StatusDecoder.hpp
 * @brief Converts raw PowerNet values into a decoded UPS status.
 */

#pragma once

#include "core/types/UpsStatus.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace apcups::core {

/**
 * @brief Code-to-name tables of the enumerated PowerNet attributes.
 */
using EnumTable = std::map<std::string, std::map<int64_t, std::string>, std::less<>>;

/**
 * @brief Symbolic values of the enumerated status attributes.
 */
namespace UpsStates {
    constexpr const char* OUTPUT_UNKNOWN = "unknown";
    constexpr const char* OUTPUT_ON_BATTERY = "onBattery";
    constexpr const char* OUTPUT_ON_SMART_BOOST = "onSmartBoost";
    constexpr const char* BATTERY_NEEDS_REPLACING = "batteryNeedsReplacing";
    constexpr const char* NO_BATTERY_NEEDS_REPLACING = "noBatteryNeedsReplacing";
}

/**
 * @brief Stateless decoder from RawStatus to UpsStatus.
 *
 * Enumerated attributes are replaced by their symbolic names and the
 * MM/DD/YY date attributes by calendar dates. Values that cannot be
 * decoded are passed through unchanged and reported as warnings.
 */
class StatusDecoder {
public:
    /**
     * @brief Returns the process-wide enumeration table.
     */
    static const EnumTable& enumTable();

    /**
     * @brief Decodes one query result.
     * @param raw Attribute values as returned by the agent.
     * @return The decoded status, including any decode warnings.
     */
    static UpsStatus decode(const RawStatus& raw);

    /**
     * @brief Looks up the symbolic name of an enumerated value.
     * @param attribute Enumerated attribute name.
     * @param code Raw integer code.
     * @return The name, or std::nullopt for an unknown attribute or code.
     */
    static std::optional<std::string> decodeEnum(std::string_view attribute, int64_t code);

    /**
     * @brief Parses an APC MM/DD/YY date.
     *
     * Two-digit years from 50 map to 19xx, those below 50 to 20xx.
     *
     * @param text Date string, e.g. "01/02/99".
     * @return The date, or std::nullopt if malformed or not a valid date.
     */
    static std::optional<std::chrono::year_month_day> parseDate(std::string_view text);
};

} // namespace apcups::core
