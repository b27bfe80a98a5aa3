#include "core/decoder/StatusDecoder.hpp"

#include "core/types/UpsAttributes.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>

namespace apcups::core {

namespace {

constexpr std::array<const char*, 2> kDateAttributes{
    UpsAttributes::IDENT_DATE_OF_MANUFACTURE,
    UpsAttributes::BATTERY_LAST_REPLACE_DATE,
};

// Two-digit years at or above this value belong to the 1900s.
constexpr int kCenturyPivot = 50;

std::optional<unsigned> parseField(std::string_view field) {
    if (field.empty() || field.size() > 2) {
        return std::nullopt;
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

const EnumTable& StatusDecoder::enumTable() {
    static const EnumTable table{
        {UpsAttributes::OUTPUT_STATUS,
         {
             {1, "unknown"},
             {2, "onLine"},
             {3, "onBattery"},
             {4, "onSmartBoost"},
             {5, "timedSleeping"},
             {6, "softwareBypass"},
             {7, "off"},
             {8, "rebooting"},
             {9, "switchedBypass"},
             {10, "hardwareFailureBypass"},
             {11, "sleepingUntilPowerReturn"},
             {12, "onSmartTrim"},
         }},
        {UpsAttributes::INPUT_LINE_FAIL_CAUSE,
         {
             {1, "noTransfer"},
             {2, "highLineVoltage"},
             {3, "brownout"},
             {4, "blackout"},
             {5, "smallMomentarySag"},
             {6, "deepMomentarySag"},
             {7, "smallMomentarySpike"},
             {8, "largeMomentarySpike"},
             {9, "selfTest"},
             {10, "rateOfVoltageChange"},
         }},
        {UpsAttributes::BATTERY_REPLACE_INDICATOR,
         {
             {1, "noBatteryNeedsReplacing"},
             {2, "batteryNeedsReplacing"},
         }},
        {UpsAttributes::BATTERY_STATUS,
         {
             {1, "unknown"},
             {2, "batteryNormal"},
             {3, "batteryLow"},
         }},
    };
    return table;
}

std::optional<std::string> StatusDecoder::decodeEnum(std::string_view attribute, int64_t code) {
    const auto& table = enumTable();
    auto it = table.find(attribute);
    if (it == table.end()) {
        return std::nullopt;
    }
    auto codeIt = it->second.find(code);
    if (codeIt == it->second.end()) {
        return std::nullopt;
    }
    return codeIt->second;
}

std::optional<std::chrono::year_month_day> StatusDecoder::parseDate(std::string_view text) {
    auto first = text.find('/');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = text.find('/', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    auto month = parseField(text.substr(0, first));
    auto day = parseField(text.substr(first + 1, second - first - 1));
    auto shortYear = parseField(text.substr(second + 1));
    if (!month || !day || !shortYear) {
        return std::nullopt;
    }

    int year = static_cast<int>(*shortYear);
    year += (year >= kCenturyPivot) ? 1900 : 2000;

    std::chrono::year_month_day date{std::chrono::year{year}, std::chrono::month{*month},
                                     std::chrono::day{*day}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

UpsStatus StatusDecoder::decode(const RawStatus& raw) {
    UpsStatus status;
    status.values = raw;

    for (const auto& [attribute, codes] : enumTable()) {
        auto it = status.values.find(attribute);
        if (it == status.values.end()) {
            continue;
        }
        const auto* code = std::get_if<int64_t>(&it->second);
        if (!code) {
            continue;
        }
        auto codeIt = codes.find(*code);
        if (codeIt == codes.end()) {
            std::string message = "unrecognized code " + std::to_string(*code);
            spdlog::warn("Leaving {} undecoded: {}", attribute, message);
            status.warnings.push_back({attribute, message});
            continue;
        }
        it->second = codeIt->second;
    }

    for (const char* attribute : kDateAttributes) {
        auto it = status.values.find(attribute);
        if (it == status.values.end()) {
            continue;
        }
        const auto* text = std::get_if<std::string>(&it->second);
        if (!text) {
            continue;
        }
        auto date = parseDate(*text);
        if (!date) {
            std::string message = "unparseable date '" + *text + "'";
            spdlog::warn("Leaving {} undecoded: {}", attribute, message);
            status.warnings.push_back({attribute, message});
            continue;
        }
        it->second = *date;
    }

    return status;
}

} // namespace apcups::core
