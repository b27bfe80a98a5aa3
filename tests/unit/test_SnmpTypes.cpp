#include <catch2/catch_test_macros.hpp>

#include "core/types/SnmpTypes.hpp"

using namespace apcups::core;

TEST_CASE("SNMP version string conversion", "[SnmpTypes]") {
    SECTION("snmpVersionToString") {
        REQUIRE(snmpVersionToString(SnmpVersion::V1) == "v1");
        REQUIRE(snmpVersionToString(SnmpVersion::V2c) == "v2c");
    }

    SECTION("snmpVersionFromString") {
        REQUIRE(snmpVersionFromString("v1") == SnmpVersion::V1);
        REQUIRE(snmpVersionFromString("1") == SnmpVersion::V1);
        REQUIRE(snmpVersionFromString("v2c") == SnmpVersion::V2c);
        REQUIRE(snmpVersionFromString("2c") == SnmpVersion::V2c);
        REQUIRE(snmpVersionFromString("2") == SnmpVersion::V2c);
        REQUIRE(snmpVersionFromString("invalid") == SnmpVersion::V1);
    }
}

TEST_CASE("SNMP data type string conversion", "[SnmpTypes]") {
    REQUIRE(snmpDataTypeToString(SnmpDataType::Integer) == "INTEGER");
    REQUIRE(snmpDataTypeToString(SnmpDataType::OctetString) == "OCTET STRING");
    REQUIRE(snmpDataTypeToString(SnmpDataType::ObjectIdentifier) == "OBJECT IDENTIFIER");
    REQUIRE(snmpDataTypeToString(SnmpDataType::TimeTicks) == "TimeTicks");
    REQUIRE(snmpDataTypeToString(SnmpDataType::Gauge32) == "Gauge32");
    REQUIRE(snmpDataTypeToString(SnmpDataType::NoSuchObject) == "noSuchObject");
    REQUIRE(snmpDataTypeToString(SnmpDataType::EndOfMibView) == "endOfMibView");
    REQUIRE(snmpDataTypeToString(SnmpDataType::Unknown) == "Unknown");
}

TEST_CASE("SnmpVarBind", "[SnmpTypes]") {
    SECTION("Default values") {
        SnmpVarBind vb;
        REQUIRE(vb.oid.empty());
        REQUIRE(vb.type == SnmpDataType::Unknown);
        REQUIRE(vb.value.empty());
        REQUIRE_FALSE(vb.intValue.has_value());
        REQUIRE_FALSE(vb.counterValue.has_value());
    }

    SECTION("Exception types carry no value") {
        SnmpVarBind vb;
        for (auto type : {SnmpDataType::Null, SnmpDataType::NoSuchObject,
                          SnmpDataType::NoSuchInstance, SnmpDataType::EndOfMibView}) {
            vb.type = type;
            REQUIRE(vb.isException());
        }
        for (auto type : {SnmpDataType::Integer, SnmpDataType::OctetString,
                          SnmpDataType::TimeTicks, SnmpDataType::Gauge32}) {
            vb.type = type;
            REQUIRE_FALSE(vb.isException());
        }
    }
}

TEST_CASE("SnmpResult", "[SnmpTypes]") {
    SECTION("Default values") {
        SnmpResult result;
        REQUIRE(result.version == SnmpVersion::V1);
        REQUIRE(result.varbinds.empty());
        REQUIRE(result.attempts == 0);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.failure == SnmpFailure::None);
        REQUIRE(result.errorMessage.empty());
        REQUIRE(result.errorStatus == 0);
        REQUIRE(result.errorIndex == 0);
    }

    SECTION("Response time conversion") {
        SnmpResult result;
        result.responseTime = std::chrono::microseconds(1500);
        REQUIRE(result.responseTimeMs() == 1.5);

        result.responseTime = std::chrono::microseconds(10000);
        REQUIRE(result.responseTimeMs() == 10.0);
    }
}

TEST_CASE("SnmpDeviceConfig defaults", "[SnmpTypes]") {
    SnmpDeviceConfig config;
    REQUIRE(config.version == SnmpVersion::V1);
    REQUIRE(config.community == "public");
    REQUIRE(config.port == 161);
    REQUIRE(config.timeoutMs == 500);
    REQUIRE(config.retries == 1);
}
