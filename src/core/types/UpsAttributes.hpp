/**
 * @file UpsAttributes.hpp
 * @brief PowerNet MIB object names queried from an APC management card.
 */

#pragma once

#include <array>
#include <string_view>

namespace apcups::core {

/**
 * @brief Symbolic PowerNet MIB names of the UPS objects.
 *
 * Names are resolved to numeric OIDs through the MIB file at query time.
 */
namespace UpsAttributes {
    /** @name Battery
     *  @{ */
    constexpr const char* BATTERY_NOMINAL_VOLTAGE = "upsAdvBatteryNominalVoltage"; ///< VDC
    constexpr const char* BATTERY_ACTUAL_VOLTAGE = "upsAdvBatteryActualVoltage";   ///< VDC
    constexpr const char* BATTERY_CURRENT = "upsAdvBatteryCurrent";                ///< Amperes
    constexpr const char* TOTAL_DC_CURRENT = "upsAdvTotalDCCurrent";               ///< Amperes
    constexpr const char* BATTERY_CAPACITY = "upsAdvBatteryCapacity";              ///< Percent
    constexpr const char* BATTERY_TEMPERATURE = "upsAdvBatteryTemperature";        ///< Celsius
    constexpr const char* BATTERY_RUNTIME_REMAINING = "upsAdvBatteryRunTimeRemaining"; ///< Ticks
    constexpr const char* BATTERY_REPLACE_INDICATOR = "upsAdvBatteryReplaceIndicator"; ///< Enum
    constexpr const char* BATTERY_LAST_REPLACE_DATE = "upsBasicBatteryLastReplaceDate"; ///< MM/DD/YY
    constexpr const char* BATTERY_TIME_ON_BATTERY = "upsBasicBatteryTimeOnBattery"; ///< Ticks
    constexpr const char* BATTERY_STATUS = "upsBasicBatteryStatus";                 ///< Enum
    /** @} */

    /** @name Identification
     *  @{ */
    constexpr const char* IDENT_MODEL = "upsBasicIdentModel";
    constexpr const char* IDENT_NAME = "upsBasicIdentName";
    constexpr const char* IDENT_SERIAL_NUMBER = "upsAdvIdentSerialNumber";
    constexpr const char* IDENT_FIRMWARE_REVISION = "upsAdvIdentFirmwareRevision";
    constexpr const char* IDENT_DATE_OF_MANUFACTURE = "upsAdvIdentDateOfManufacture"; ///< MM/DD/YY
    /** @} */

    /** @name Input
     *  @{ */
    constexpr const char* INPUT_PHASE = "upsBasicInputPhase";
    constexpr const char* INPUT_MAX_LINE_VOLTAGE = "upsAdvInputMaxLineVoltage"; ///< VAC, last 60s
    constexpr const char* INPUT_MIN_LINE_VOLTAGE = "upsAdvInputMinLineVoltage"; ///< VAC, last 60s
    constexpr const char* INPUT_LINE_VOLTAGE = "upsAdvInputLineVoltage";        ///< VAC
    constexpr const char* INPUT_FREQUENCY = "upsAdvInputFrequency";             ///< Hz
    constexpr const char* INPUT_LINE_FAIL_CAUSE = "upsAdvInputLineFailCause";   ///< Enum
    /** @} */

    /** @name Output
     *  @{ */
    constexpr const char* OUTPUT_PHASE = "upsBasicOutputPhase";
    constexpr const char* OUTPUT_LOAD = "upsAdvOutputLoad";           ///< Percent
    constexpr const char* OUTPUT_VOLTAGE = "upsAdvOutputVoltage";     ///< VAC
    constexpr const char* OUTPUT_FREQUENCY = "upsAdvOutputFrequency"; ///< Hz
    constexpr const char* OUTPUT_STATUS = "upsBasicOutputStatus";     ///< Enum
    /** @} */
}

/**
 * @brief Objects fetched by one status query, in request order.
 *
 * Response values are matched to names by position.
 */
inline constexpr std::array<std::string_view, 27> kQueryAttributes{
    UpsAttributes::BATTERY_NOMINAL_VOLTAGE,
    UpsAttributes::BATTERY_ACTUAL_VOLTAGE,
    UpsAttributes::BATTERY_CURRENT,
    UpsAttributes::TOTAL_DC_CURRENT,
    UpsAttributes::IDENT_MODEL,
    UpsAttributes::IDENT_SERIAL_NUMBER,
    UpsAttributes::BATTERY_CAPACITY,
    UpsAttributes::BATTERY_TEMPERATURE,
    UpsAttributes::INPUT_PHASE,
    UpsAttributes::OUTPUT_PHASE,
    UpsAttributes::OUTPUT_LOAD,
    UpsAttributes::OUTPUT_VOLTAGE,
    UpsAttributes::OUTPUT_FREQUENCY,
    UpsAttributes::OUTPUT_STATUS,
    UpsAttributes::BATTERY_RUNTIME_REMAINING,
    UpsAttributes::INPUT_MAX_LINE_VOLTAGE,
    UpsAttributes::INPUT_MIN_LINE_VOLTAGE,
    UpsAttributes::INPUT_LINE_VOLTAGE,
    UpsAttributes::INPUT_FREQUENCY,
    UpsAttributes::INPUT_LINE_FAIL_CAUSE,
    UpsAttributes::IDENT_NAME,
    UpsAttributes::IDENT_FIRMWARE_REVISION,
    UpsAttributes::IDENT_DATE_OF_MANUFACTURE,
    UpsAttributes::BATTERY_REPLACE_INDICATOR,
    UpsAttributes::BATTERY_LAST_REPLACE_DATE,
    UpsAttributes::BATTERY_TIME_ON_BATTERY,
    UpsAttributes::BATTERY_STATUS,
};

} // namespace apcups::core
