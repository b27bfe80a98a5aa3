#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace apcups::infra {

/**
 * @brief SNMP PDU types handled by the codec.
 */
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2
};

/**
 * @brief A decoded SNMP v1/v2c message.
 *
 * Request varbinds carry SnmpDataType::Null values.
 */
struct SnmpMessage {
    core::SnmpVersion version{core::SnmpVersion::V1};
    std::string community{"public"};
    PduType pduType{PduType::GetRequest};
    int32_t requestId{0};
    int errorStatus{0};
    int errorIndex{0};
    std::vector<core::SnmpVarBind> varbinds;
};

/**
 * @brief ASN.1 BER encoding and decoding of SNMP v1/v2c messages.
 *
 * Decoding functions throw std::runtime_error on malformed or truncated
 * input; they never read past the supplied buffer.
 */
class BerCodec {
public:
    // ASN.1/BER tag types
    static constexpr uint8_t TAG_INTEGER = 0x02;
    static constexpr uint8_t TAG_OCTET_STRING = 0x04;
    static constexpr uint8_t TAG_NULL = 0x05;
    static constexpr uint8_t TAG_OID = 0x06;
    static constexpr uint8_t TAG_SEQUENCE = 0x30;
    static constexpr uint8_t TAG_IP_ADDRESS = 0x40;
    static constexpr uint8_t TAG_COUNTER32 = 0x41;
    static constexpr uint8_t TAG_GAUGE32 = 0x42;
    static constexpr uint8_t TAG_TIMETICKS = 0x43;
    static constexpr uint8_t TAG_COUNTER64 = 0x46;
    static constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
    static constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
    static constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

    /**
     * @brief Encodes a complete message (request or response).
     * @param message The message to encode.
     * @return The datagram payload.
     */
    static std::vector<uint8_t> encodeMessage(const SnmpMessage& message);

    /**
     * @brief Decodes a complete message.
     * @param data The datagram payload.
     * @return The decoded message.
     * @throws std::runtime_error on malformed input.
     */
    static SnmpMessage decodeMessage(const std::vector<uint8_t>& data);

    // BER encoding helpers
    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeInteger(int64_t value);
    static std::vector<uint8_t> encodeUnsigned(uint8_t tag, uint64_t value);
    static std::vector<uint8_t> encodeOctetString(const std::string& str);
    static std::vector<uint8_t> encodeOid(const std::string& oid);
    static std::vector<uint8_t> encodeNull();
    static std::vector<uint8_t> encodeSequence(const std::vector<uint8_t>& content);
    static std::vector<uint8_t> encodeValue(const core::SnmpVarBind& varbind);

    // BER decoding helpers
    static size_t decodeLength(const uint8_t* data, size_t size, size_t& offset);
    static int64_t decodeInteger(const uint8_t* data, size_t length);
    static uint64_t decodeUnsigned(const uint8_t* data, size_t length);
    static std::string decodeOid(const uint8_t* data, size_t length);

    // OID manipulation
    static std::vector<uint32_t> parseOidString(const std::string& oid);
    static std::string oidVectorToString(const std::vector<uint32_t>& oid);
    static bool isOidPrefix(const std::string& prefix, const std::string& oid);
};

} // namespace apcups::infra
