#include "infrastructure/network/BerCodec.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace apcups::infra {

namespace {

// SNMP version field values
constexpr int64_t SNMP_VERSION_1 = 0;
constexpr int64_t SNMP_VERSION_2C = 1;

core::SnmpDataType tagToDataType(uint8_t tag) {
    switch (tag) {
        case BerCodec::TAG_INTEGER: return core::SnmpDataType::Integer;
        case BerCodec::TAG_OCTET_STRING: return core::SnmpDataType::OctetString;
        case BerCodec::TAG_OID: return core::SnmpDataType::ObjectIdentifier;
        case BerCodec::TAG_IP_ADDRESS: return core::SnmpDataType::IpAddress;
        case BerCodec::TAG_COUNTER32: return core::SnmpDataType::Counter32;
        case BerCodec::TAG_GAUGE32: return core::SnmpDataType::Gauge32;
        case BerCodec::TAG_TIMETICKS: return core::SnmpDataType::TimeTicks;
        case BerCodec::TAG_COUNTER64: return core::SnmpDataType::Counter64;
        case BerCodec::TAG_NULL: return core::SnmpDataType::Null;
        case BerCodec::TAG_NO_SUCH_OBJECT: return core::SnmpDataType::NoSuchObject;
        case BerCodec::TAG_NO_SUCH_INSTANCE: return core::SnmpDataType::NoSuchInstance;
        case BerCodec::TAG_END_OF_MIB_VIEW: return core::SnmpDataType::EndOfMibView;
        default: return core::SnmpDataType::Unknown;
    }
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t> encodeTagged(uint8_t tag, const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded;
    encoded.push_back(tag);
    append(encoded, BerCodec::encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

// Reads a tag and its length, checks the tag and that the content fits.
size_t expectTag(const uint8_t* data, size_t size, size_t& offset, uint8_t tag,
                 const char* what) {
    if (offset >= size) {
        throw std::runtime_error(std::string("Truncated message before ") + what);
    }
    if (data[offset++] != tag) {
        throw std::runtime_error(std::string("Expected ") + what);
    }
    size_t length = BerCodec::decodeLength(data, size, offset);
    if (length > size - offset) {
        throw std::runtime_error(std::string("Truncated ") + what);
    }
    return length;
}

core::SnmpVarBind decodeVarBind(const uint8_t* data, size_t size, size_t& offset) {
    size_t seqLen = expectTag(data, size, offset, BerCodec::TAG_SEQUENCE, "SEQUENCE for varbind");
    size_t seqEnd = offset + seqLen;

    core::SnmpVarBind varbind;
    size_t oidLen = expectTag(data, seqEnd, offset, BerCodec::TAG_OID, "OID");
    varbind.oid = BerCodec::decodeOid(data + offset, oidLen);
    offset += oidLen;

    if (offset >= seqEnd) {
        throw std::runtime_error("Truncated varbind value");
    }
    uint8_t valueTag = data[offset++];
    size_t valueLen = BerCodec::decodeLength(data, seqEnd, offset);
    if (valueLen > seqEnd - offset) {
        throw std::runtime_error("Truncated varbind value");
    }
    const uint8_t* value = data + offset;

    varbind.type = tagToDataType(valueTag);

    switch (valueTag) {
        case BerCodec::TAG_INTEGER:
            varbind.intValue = BerCodec::decodeInteger(value, valueLen);
            varbind.value = std::to_string(*varbind.intValue);
            break;
        case BerCodec::TAG_OCTET_STRING:
            varbind.value = std::string(reinterpret_cast<const char*>(value), valueLen);
            break;
        case BerCodec::TAG_OID:
            varbind.value = BerCodec::decodeOid(value, valueLen);
            break;
        case BerCodec::TAG_IP_ADDRESS:
            if (valueLen == 4) {
                varbind.value = std::to_string(value[0]) + "." + std::to_string(value[1]) + "." +
                                std::to_string(value[2]) + "." + std::to_string(value[3]);
            }
            break;
        case BerCodec::TAG_COUNTER32:
        case BerCodec::TAG_GAUGE32:
        case BerCodec::TAG_TIMETICKS:
        case BerCodec::TAG_COUNTER64:
            varbind.counterValue = BerCodec::decodeUnsigned(value, valueLen);
            varbind.value = std::to_string(*varbind.counterValue);
            break;
        case BerCodec::TAG_NULL:
        case BerCodec::TAG_NO_SUCH_OBJECT:
        case BerCodec::TAG_NO_SUCH_INSTANCE:
        case BerCodec::TAG_END_OF_MIB_VIEW:
            break;
        default: {
            // Store as hex string for unknown types
            std::ostringstream oss;
            oss << std::hex;
            for (size_t i = 0; i < valueLen; ++i) {
                oss << std::setw(2) << std::setfill('0') << static_cast<int>(value[i]);
            }
            varbind.value = oss.str();
            break;
        }
    }

    offset = seqEnd;
    return varbind;
}

} // anonymous namespace

std::vector<uint8_t> BerCodec::encodeMessage(const SnmpMessage& message) {
    std::vector<uint8_t> varbindList;
    for (const auto& vb : message.varbinds) {
        std::vector<uint8_t> varbind;
        append(varbind, encodeOid(vb.oid));
        append(varbind, encodeValue(vb));
        append(varbindList, encodeSequence(varbind));
    }

    std::vector<uint8_t> pduContent;
    append(pduContent, encodeInteger(message.requestId));
    append(pduContent, encodeInteger(message.errorStatus));
    append(pduContent, encodeInteger(message.errorIndex));
    append(pduContent, encodeSequence(varbindList));

    std::vector<uint8_t> msgContent;
    append(msgContent, encodeInteger(message.version == core::SnmpVersion::V1 ? SNMP_VERSION_1
                                                                                : SNMP_VERSION_2C));
    append(msgContent, encodeOctetString(message.community));
    append(msgContent, encodeTagged(static_cast<uint8_t>(message.pduType), pduContent));

    return encodeSequence(msgContent);
}

SnmpMessage BerCodec::decodeMessage(const std::vector<uint8_t>& response) {
    const uint8_t* data = response.data();
    size_t size = response.size();
    size_t offset = 0;

    SnmpMessage message;

    size_t outerLen = expectTag(data, size, offset, TAG_SEQUENCE, "SEQUENCE");
    size = offset + outerLen;

    size_t versionLen = expectTag(data, size, offset, TAG_INTEGER, "INTEGER for version");
    int64_t version = decodeInteger(data + offset, versionLen);
    offset += versionLen;
    if (version == SNMP_VERSION_1) {
        message.version = core::SnmpVersion::V1;
    } else if (version == SNMP_VERSION_2C) {
        message.version = core::SnmpVersion::V2c;
    } else {
        throw std::runtime_error("Unsupported SNMP version " + std::to_string(version));
    }

    size_t communityLen = expectTag(data, size, offset, TAG_OCTET_STRING, "OCTET STRING for community");
    message.community = std::string(reinterpret_cast<const char*>(data + offset), communityLen);
    offset += communityLen;

    if (offset >= size) {
        throw std::runtime_error("Truncated message before PDU");
    }
    uint8_t pduTag = data[offset++];
    if (pduTag != static_cast<uint8_t>(PduType::GetRequest) &&
        pduTag != static_cast<uint8_t>(PduType::GetNextRequest) &&
        pduTag != static_cast<uint8_t>(PduType::GetResponse)) {
        throw std::runtime_error("Unsupported PDU type");
    }
    message.pduType = static_cast<PduType>(pduTag);
    size_t pduLen = decodeLength(data, size, offset);
    if (pduLen > size - offset) {
        throw std::runtime_error("Truncated PDU");
    }
    size = offset + pduLen;

    size_t reqIdLen = expectTag(data, size, offset, TAG_INTEGER, "INTEGER for request-id");
    message.requestId = static_cast<int32_t>(decodeInteger(data + offset, reqIdLen));
    offset += reqIdLen;

    size_t errorStatusLen = expectTag(data, size, offset, TAG_INTEGER, "INTEGER for error-status");
    message.errorStatus = static_cast<int>(decodeInteger(data + offset, errorStatusLen));
    offset += errorStatusLen;

    size_t errorIndexLen = expectTag(data, size, offset, TAG_INTEGER, "INTEGER for error-index");
    message.errorIndex = static_cast<int>(decodeInteger(data + offset, errorIndexLen));
    offset += errorIndexLen;

    size_t varbindListLen = expectTag(data, size, offset, TAG_SEQUENCE, "SEQUENCE for varbind-list");
    size_t varbindListEnd = offset + varbindListLen;

    while (offset < varbindListEnd) {
        message.varbinds.push_back(decodeVarBind(data, varbindListEnd, offset));
    }

    return message;
}

// BER encoding helpers

std::vector<uint8_t> BerCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 256) {
        encoded.push_back(0x81);
        encoded.push_back(static_cast<uint8_t>(length));
    } else if (length < 65536) {
        encoded.push_back(0x82);
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    } else {
        encoded.push_back(0x83);
        encoded.push_back(static_cast<uint8_t>((length >> 16) & 0xFF));
        encoded.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        encoded.push_back(static_cast<uint8_t>(length & 0xFF));
    }

    return encoded;
}

std::vector<uint8_t> BerCodec::encodeInteger(int64_t value) {
    // Minimal two's complement, most significant byte first
    std::vector<uint8_t> bytes;
    for (;;) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
        bool signBit = (bytes.front() & 0x80) != 0;
        if ((value == 0 && !signBit) || (value == -1 && signBit)) {
            break;
        }
    }
    return encodeTagged(TAG_INTEGER, bytes);
}

std::vector<uint8_t> BerCodec::encodeUnsigned(uint8_t tag, uint64_t value) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);

    // Add leading zero if high bit is set
    if (bytes[0] & 0x80) {
        bytes.insert(bytes.begin(), 0);
    }
    return encodeTagged(tag, bytes);
}

std::vector<uint8_t> BerCodec::encodeOctetString(const std::string& str) {
    return encodeTagged(TAG_OCTET_STRING, std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> BerCodec::encodeOid(const std::string& oid) {
    auto components = parseOidString(oid);
    if (components.size() < 2) {
        throw std::runtime_error("OID needs at least two components: '" + oid + "'");
    }

    std::vector<uint8_t> oidBytes;
    auto appendSubId = [&oidBytes](uint32_t val) {
        std::vector<uint8_t> subId;
        do {
            subId.insert(subId.begin(), static_cast<uint8_t>(val & 0x7F));
            val >>= 7;
        } while (val > 0);
        // Set high bit on all but last byte
        for (size_t j = 0; j + 1 < subId.size(); ++j) {
            subId[j] |= 0x80;
        }
        oidBytes.insert(oidBytes.end(), subId.begin(), subId.end());
    };

    // First two components are encoded as (first * 40 + second)
    appendSubId(components[0] * 40 + components[1]);
    for (size_t i = 2; i < components.size(); ++i) {
        appendSubId(components[i]);
    }

    return encodeTagged(TAG_OID, oidBytes);
}

std::vector<uint8_t> BerCodec::encodeNull() {
    return {TAG_NULL, 0x00};
}

std::vector<uint8_t> BerCodec::encodeSequence(const std::vector<uint8_t>& content) {
    return encodeTagged(TAG_SEQUENCE, content);
}

std::vector<uint8_t> BerCodec::encodeValue(const core::SnmpVarBind& varbind) {
    switch (varbind.type) {
        case core::SnmpDataType::Integer:
            return encodeInteger(varbind.intValue.value_or(0));
        case core::SnmpDataType::OctetString:
            return encodeOctetString(varbind.value);
        case core::SnmpDataType::ObjectIdentifier:
            return encodeOid(varbind.value);
        case core::SnmpDataType::Counter32:
            return encodeUnsigned(TAG_COUNTER32, varbind.counterValue.value_or(0));
        case core::SnmpDataType::Gauge32:
            return encodeUnsigned(TAG_GAUGE32, varbind.counterValue.value_or(0));
        case core::SnmpDataType::TimeTicks:
            return encodeUnsigned(TAG_TIMETICKS, varbind.counterValue.value_or(0));
        case core::SnmpDataType::Counter64:
            return encodeUnsigned(TAG_COUNTER64, varbind.counterValue.value_or(0));
        case core::SnmpDataType::NoSuchObject:
            return {TAG_NO_SUCH_OBJECT, 0x00};
        case core::SnmpDataType::NoSuchInstance:
            return {TAG_NO_SUCH_INSTANCE, 0x00};
        case core::SnmpDataType::EndOfMibView:
            return {TAG_END_OF_MIB_VIEW, 0x00};
        default:
            return encodeNull();
    }
}

// BER decoding helpers

size_t BerCodec::decodeLength(const uint8_t* data, size_t size, size_t& offset) {
    if (offset >= size) {
        throw std::runtime_error("Truncated length");
    }
    uint8_t first = data[offset++];

    if ((first & 0x80) == 0) {
        return first;
    }

    size_t numBytes = first & 0x7F;
    if (numBytes == 0 || numBytes > 4) {
        throw std::runtime_error("Unsupported length encoding");
    }
    if (numBytes > size - offset) {
        throw std::runtime_error("Truncated length");
    }

    size_t length = 0;
    for (size_t i = 0; i < numBytes; ++i) {
        length = (length << 8) | data[offset++];
    }

    return length;
}

int64_t BerCodec::decodeInteger(const uint8_t* data, size_t length) {
    if (length == 0) return 0;
    if (length > 8) {
        throw std::runtime_error("INTEGER too long");
    }

    // Sign extend from the first byte
    uint64_t value = (data[0] & 0x80) ? ~uint64_t{0} : 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return static_cast<int64_t>(value);
}

uint64_t BerCodec::decodeUnsigned(const uint8_t* data, size_t length) {
    if (length > 9 || (length == 9 && data[0] != 0)) {
        throw std::runtime_error("Unsigned value too long");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

std::string BerCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) return "";

    std::vector<uint32_t> subIds;
    uint32_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        if ((data[i] & 0x80) == 0) {
            subIds.push_back(value);
            value = 0;
        }
    }
    if (data[length - 1] & 0x80) {
        throw std::runtime_error("Truncated OID sub-identifier");
    }

    // First sub-identifier encodes the first two components
    std::vector<uint32_t> components;
    uint32_t first = subIds[0];
    if (first < 40) {
        components.push_back(0);
        components.push_back(first);
    } else if (first < 80) {
        components.push_back(1);
        components.push_back(first - 40);
    } else {
        components.push_back(2);
        components.push_back(first - 80);
    }
    components.insert(components.end(), subIds.begin() + 1, subIds.end());

    return oidVectorToString(components);
}

std::vector<uint32_t> BerCodec::parseOidString(const std::string& oid) {
    std::vector<uint32_t> components;
    std::istringstream iss(oid);
    std::string token;

    while (std::getline(iss, token, '.')) {
        if (token.empty()) {
            continue;
        }
        if (token.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("Invalid OID component '" + token + "' in '" + oid + "'");
        }
        components.push_back(static_cast<uint32_t>(std::stoul(token)));
    }

    return components;
}

std::string BerCodec::oidVectorToString(const std::vector<uint32_t>& oid) {
    std::ostringstream oss;
    for (size_t i = 0; i < oid.size(); ++i) {
        if (i > 0) oss << ".";
        oss << oid[i];
    }
    return oss.str();
}

bool BerCodec::isOidPrefix(const std::string& prefix, const std::string& oid) {
    if (oid.size() < prefix.size()) return false;
    if (oid.compare(0, prefix.size(), prefix) != 0) return false;

    // Ensure we're at a boundary
    if (oid.size() > prefix.size() && oid[prefix.size()] != '.') {
        return false;
    }

    return true;
}

} // namespace apcups::infra
