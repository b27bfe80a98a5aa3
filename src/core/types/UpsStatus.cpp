#include "core/types/UpsStatus.hpp"

#include <fmt/format.h>

namespace apcups::core {

bool UpsStatus::contains(const std::string& name) const {
    auto it = values.find(name);
    return it != values.end() && !std::holds_alternative<std::monostate>(it->second);
}

AttributeValue UpsStatus::value(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::monostate{};
    }
    return it->second;
}

std::optional<int64_t> UpsStatus::integer(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (const auto* v = std::get_if<int64_t>(&it->second)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<std::string> UpsStatus::text(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (const auto* v = std::get_if<std::string>(&it->second)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<std::chrono::year_month_day> UpsStatus::date(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (const auto* v = std::get_if<std::chrono::year_month_day>(&it->second)) {
        return *v;
    }
    return std::nullopt;
}

std::string formatDate(const std::chrono::year_month_day& date) {
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

std::string attributeValueToString(const AttributeValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* d = std::get_if<std::chrono::year_month_day>(&value)) {
        return formatDate(*d);
    }
    return "";
}

} // namespace apcups::core
