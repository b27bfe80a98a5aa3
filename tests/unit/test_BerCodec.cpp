#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/BerCodec.hpp"

#include <stdexcept>

using namespace apcups::core;
using namespace apcups::infra;

TEST_CASE("BER length encoding", "[BerCodec]") {
    REQUIRE(BerCodec::encodeLength(0) == std::vector<uint8_t>{0x00});
    REQUIRE(BerCodec::encodeLength(127) == std::vector<uint8_t>{0x7F});
    REQUIRE(BerCodec::encodeLength(128) == std::vector<uint8_t>{0x81, 0x80});
    REQUIRE(BerCodec::encodeLength(300) == std::vector<uint8_t>{0x82, 0x01, 0x2C});

    SECTION("decodeLength reads both forms") {
        std::vector<uint8_t> shortForm{0x05};
        size_t offset = 0;
        REQUIRE(BerCodec::decodeLength(shortForm.data(), shortForm.size(), offset) == 5);
        REQUIRE(offset == 1);

        std::vector<uint8_t> longForm{0x82, 0x01, 0x2C};
        offset = 0;
        REQUIRE(BerCodec::decodeLength(longForm.data(), longForm.size(), offset) == 300);
        REQUIRE(offset == 3);
    }

    SECTION("decodeLength rejects truncation") {
        std::vector<uint8_t> truncated{0x82, 0x01};
        size_t offset = 0;
        REQUIRE_THROWS_AS(BerCodec::decodeLength(truncated.data(), truncated.size(), offset),
                          std::runtime_error);
    }
}

TEST_CASE("BER integer encoding", "[BerCodec]") {
    REQUIRE(BerCodec::encodeInteger(0) == std::vector<uint8_t>{0x02, 0x01, 0x00});
    REQUIRE(BerCodec::encodeInteger(127) == std::vector<uint8_t>{0x02, 0x01, 0x7F});
    REQUIRE(BerCodec::encodeInteger(128) == std::vector<uint8_t>{0x02, 0x02, 0x00, 0x80});
    REQUIRE(BerCodec::encodeInteger(-1) == std::vector<uint8_t>{0x02, 0x01, 0xFF});
    REQUIRE(BerCodec::encodeInteger(-129) == std::vector<uint8_t>{0x02, 0x02, 0xFF, 0x7F});

    SECTION("decodeInteger sign-extends") {
        std::vector<uint8_t> negative{0xFF, 0x7F};
        REQUIRE(BerCodec::decodeInteger(negative.data(), negative.size()) == -129);

        std::vector<uint8_t> positive{0x00, 0x80};
        REQUIRE(BerCodec::decodeInteger(positive.data(), positive.size()) == 128);
    }

    SECTION("Unsigned values get a leading zero when the high bit is set") {
        REQUIRE(BerCodec::encodeUnsigned(BerCodec::TAG_TIMETICKS, 200) ==
                std::vector<uint8_t>{0x43, 0x02, 0x00, 0xC8});

        std::vector<uint8_t> ticks{0x00, 0xC8};
        REQUIRE(BerCodec::decodeUnsigned(ticks.data(), ticks.size()) == 200);
    }
}

TEST_CASE("BER OID encoding", "[BerCodec]") {
    SECTION("Encodes the PowerNet enterprise prefix") {
        // 1.3.6.1.4.1.318 -> 2B 06 01 04 01 82 3E
        REQUIRE(BerCodec::encodeOid("1.3.6.1.4.1.318") ==
                std::vector<uint8_t>{0x06, 0x07, 0x2B, 0x06, 0x01, 0x04, 0x01, 0x82, 0x3E});
    }

    SECTION("decodeOid reverses the first sub-identifier split") {
        std::vector<uint8_t> body{0x2B, 0x06, 0x01, 0x04, 0x01, 0x82, 0x3E};
        REQUIRE(BerCodec::decodeOid(body.data(), body.size()) == "1.3.6.1.4.1.318");

        std::vector<uint8_t> joint{0x88, 0x37, 0x03};
        REQUIRE(BerCodec::decodeOid(joint.data(), joint.size()) == "2.999.3");
    }

    SECTION("Rejects invalid OIDs") {
        REQUIRE_THROWS_AS(BerCodec::encodeOid("1"), std::runtime_error);
        REQUIRE_THROWS_AS(BerCodec::encodeOid("1.3.x.1"), std::runtime_error);

        std::vector<uint8_t> truncated{0x2B, 0x82};
        REQUIRE_THROWS_AS(BerCodec::decodeOid(truncated.data(), truncated.size()),
                          std::runtime_error);
    }

    SECTION("OID string helpers") {
        REQUIRE(BerCodec::parseOidString(".1.3.6.1") == std::vector<uint32_t>{1, 3, 6, 1});
        REQUIRE(BerCodec::oidVectorToString({1, 3, 6, 1, 4, 1, 318}) == "1.3.6.1.4.1.318");
    }

    SECTION("isOidPrefix respects component boundaries") {
        REQUIRE(BerCodec::isOidPrefix("1.3.6.1.4.1.318.1.1.1.2.2.1",
                                      "1.3.6.1.4.1.318.1.1.1.2.2.1.0"));
        REQUIRE(BerCodec::isOidPrefix("1.3.6.1", "1.3.6.1"));
        REQUIRE_FALSE(BerCodec::isOidPrefix("1.3.6.1.4.1.318.1.1.1.2.2.1",
                                            "1.3.6.1.4.1.318.1.1.1.2.2.10.0"));
        REQUIRE_FALSE(BerCodec::isOidPrefix("1.3.6.1.4.1.318.1.1.1.2.2.1",
                                            "1.3.6.1.4.1.318.1.1.1.2.2.2.0"));
    }
}

TEST_CASE("SNMP message encoding", "[BerCodec]") {
    SECTION("GET-NEXT request matches the wire format") {
        SnmpMessage request;
        request.version = SnmpVersion::V1;
        request.community = "public";
        request.pduType = PduType::GetNextRequest;
        request.requestId = 1;
        SnmpVarBind vb;
        vb.oid = "1.3.6.1.2.1.1";
        vb.type = SnmpDataType::Null;
        request.varbinds.push_back(vb);

        std::vector<uint8_t> expected{
            0x30, 0x24,                                     // message
            0x02, 0x01, 0x00,                               // version 1
            0x04, 0x06, 'p', 'u', 'b', 'l', 'i', 'c',       // community
            0xA1, 0x17,                                     // GetNextRequest
            0x02, 0x01, 0x01,                               // request-id
            0x02, 0x01, 0x00,                               // error-status
            0x02, 0x01, 0x00,                               // error-index
            0x30, 0x0C,                                     // varbind list
            0x30, 0x0A,                                     // varbind
            0x06, 0x06, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, // OID
            0x05, 0x00,                                     // NULL
        };
        REQUIRE(BerCodec::encodeMessage(request) == expected);
    }

    SECTION("Response values decode to typed varbinds") {
        SnmpMessage response;
        response.version = SnmpVersion::V2c;
        response.community = "private";
        response.pduType = PduType::GetResponse;
        response.requestId = 0x12345678;

        SnmpVarBind capacity;
        capacity.oid = "1.3.6.1.4.1.318.1.1.1.2.2.1.0";
        capacity.type = SnmpDataType::Gauge32;
        capacity.counterValue = 87;

        SnmpVarBind model;
        model.oid = "1.3.6.1.4.1.318.1.1.1.1.1.1.0";
        model.type = SnmpDataType::OctetString;
        model.value = "Smart-UPS 1500";

        SnmpVarBind status;
        status.oid = "1.3.6.1.4.1.318.1.1.1.4.1.1.0";
        status.type = SnmpDataType::Integer;
        status.intValue = 3;

        SnmpVarBind missing;
        missing.oid = "1.3.6.1.4.1.318.1.1.1.9";
        missing.type = SnmpDataType::EndOfMibView;

        response.varbinds = {capacity, model, status, missing};

        auto decoded = BerCodec::decodeMessage(BerCodec::encodeMessage(response));
        REQUIRE(decoded.version == SnmpVersion::V2c);
        REQUIRE(decoded.community == "private");
        REQUIRE(decoded.pduType == PduType::GetResponse);
        REQUIRE(decoded.requestId == 0x12345678);
        REQUIRE(decoded.varbinds.size() == 4);

        REQUIRE(decoded.varbinds[0].type == SnmpDataType::Gauge32);
        REQUIRE(decoded.varbinds[0].counterValue == 87u);
        REQUIRE(decoded.varbinds[1].value == "Smart-UPS 1500");
        REQUIRE(decoded.varbinds[2].intValue == 3);
        REQUIRE(decoded.varbinds[3].type == SnmpDataType::EndOfMibView);
        REQUIRE(decoded.varbinds[3].isException());
    }
}

TEST_CASE("SNMP message decoding rejects malformed input", "[BerCodec]") {
    SECTION("Empty datagram") {
        REQUIRE_THROWS_AS(BerCodec::decodeMessage({}), std::runtime_error);
    }

    SECTION("Not a sequence") {
        REQUIRE_THROWS_AS(BerCodec::decodeMessage({0x02, 0x01, 0x00}), std::runtime_error);
    }

    SECTION("Truncated message") {
        SnmpMessage request;
        SnmpVarBind vb;
        vb.oid = "1.3.6.1.2.1.1.1";
        vb.type = SnmpDataType::Null;
        request.varbinds.push_back(vb);
        auto packet = BerCodec::encodeMessage(request);

        for (size_t cut : {packet.size() - 1, packet.size() / 2, size_t{3}}) {
            std::vector<uint8_t> truncated(packet.begin(), packet.begin() + cut);
            REQUIRE_THROWS_AS(BerCodec::decodeMessage(truncated), std::runtime_error);
        }
    }

    SECTION("Unsupported version") {
        // version 3
        std::vector<uint8_t> v3{0x30, 0x0B, 0x02, 0x01, 0x03, 0x04, 0x00, 0xA2,
                                0x04, 0x02, 0x01, 0x01, 0x30, 0x00};
        REQUIRE_THROWS_AS(BerCodec::decodeMessage(v3), std::runtime_error);
    }
}
