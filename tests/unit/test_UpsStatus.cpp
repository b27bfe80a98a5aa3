#include <catch2/catch_test_macros.hpp>

#include "core/types/UpsAttributes.hpp"
#include "core/types/UpsStatus.hpp"

#include <set>

using namespace apcups::core;
using namespace std::chrono;

TEST_CASE("Query attribute list", "[UpsStatus]") {
    SECTION("Holds 27 distinct names") {
        std::set<std::string_view> names(kQueryAttributes.begin(), kQueryAttributes.end());
        REQUIRE(names.size() == 27);
    }

    SECTION("Keeps the request order") {
        REQUIRE(kQueryAttributes.front() == UpsAttributes::BATTERY_NOMINAL_VOLTAGE);
        REQUIRE(kQueryAttributes[13] == UpsAttributes::OUTPUT_STATUS);
        REQUIRE(kQueryAttributes[14] == UpsAttributes::BATTERY_RUNTIME_REMAINING);
        REQUIRE(kQueryAttributes.back() == UpsAttributes::BATTERY_STATUS);
    }
}

TEST_CASE("UpsStatus typed readers", "[UpsStatus]") {
    UpsStatus status;
    status.values[UpsAttributes::BATTERY_CAPACITY] = int64_t{87};
    status.values[UpsAttributes::IDENT_MODEL] = std::string("Smart-UPS 1500");
    status.values[UpsAttributes::IDENT_DATE_OF_MANUFACTURE] = year{1999} / January / 2;
    status.values[UpsAttributes::IDENT_NAME] = std::monostate{};

    SECTION("contains") {
        REQUIRE(status.contains(UpsAttributes::BATTERY_CAPACITY));
        REQUIRE_FALSE(status.contains(UpsAttributes::IDENT_NAME));
        REQUIRE_FALSE(status.contains(UpsAttributes::OUTPUT_LOAD));
    }

    SECTION("integer") {
        REQUIRE(status.integer(UpsAttributes::BATTERY_CAPACITY) == 87);
        REQUIRE_FALSE(status.integer(UpsAttributes::IDENT_MODEL).has_value());
        REQUIRE_FALSE(status.integer(UpsAttributes::OUTPUT_LOAD).has_value());
    }

    SECTION("text") {
        REQUIRE(status.text(UpsAttributes::IDENT_MODEL) == "Smart-UPS 1500");
        REQUIRE_FALSE(status.text(UpsAttributes::BATTERY_CAPACITY).has_value());
    }

    SECTION("date") {
        auto date = status.date(UpsAttributes::IDENT_DATE_OF_MANUFACTURE);
        REQUIRE(date.has_value());
        REQUIRE(*date == year{1999} / January / 2);
        REQUIRE_FALSE(status.date(UpsAttributes::IDENT_MODEL).has_value());
    }

    SECTION("value of an absent attribute") {
        REQUIRE(std::holds_alternative<std::monostate>(status.value(UpsAttributes::OUTPUT_LOAD)));
    }
}

TEST_CASE("Attribute value formatting", "[UpsStatus]") {
    SECTION("formatDate pads fields") {
        REQUIRE(formatDate(year{2005} / March / 7) == "2005-03-07");
        REQUIRE(formatDate(year{1950} / June / 15) == "1950-06-15");
    }

    SECTION("attributeValueToString") {
        REQUIRE(attributeValueToString(AttributeValue{int64_t{-12}}) == "-12");
        REQUIRE(attributeValueToString(AttributeValue{std::string("UB0123")}) == "UB0123");
        REQUIRE(attributeValueToString(AttributeValue{year{1999} / January / 2}) == "1999-01-02");
        REQUIRE(attributeValueToString(AttributeValue{}).empty());
    }
}
