#include "infrastructure/ups/UpsClient.hpp"

#include "core/decoder/StatusDecoder.hpp"
#include "core/types/UpsAttributes.hpp"
#include "infrastructure/network/BerCodec.hpp"
#include "infrastructure/network/PingService.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace apcups::infra {

namespace {

constexpr const char* kUnableToSnmp = "Unable to SNMP.";
constexpr const char* kUnableToFetch = "Unable to fetch UPS parameters.";

core::AttributeValue toAttributeValue(const core::SnmpVarBind& varbind) {
    if (varbind.isException()) {
        return std::monostate{};
    }

    switch (varbind.type) {
        case core::SnmpDataType::Integer:
            if (varbind.intValue) return *varbind.intValue;
            break;
        case core::SnmpDataType::Counter32:
        case core::SnmpDataType::Gauge32:
        case core::SnmpDataType::TimeTicks:
        case core::SnmpDataType::Counter64:
            if (varbind.counterValue) return static_cast<int64_t>(*varbind.counterValue);
            break;
        case core::SnmpDataType::OctetString:
        case core::SnmpDataType::ObjectIdentifier:
        case core::SnmpDataType::IpAddress:
            return varbind.value;
        default:
            spdlog::warn("Ignoring {} value of type {}", varbind.oid,
                         core::snmpDataTypeToString(varbind.type));
            break;
    }
    return std::monostate{};
}

} // namespace

std::string upsErrorKindToString(UpsErrorKind kind) {
    switch (kind) {
        case UpsErrorKind::Configuration: return "configuration";
        case UpsErrorKind::Resolution: return "resolution";
        case UpsErrorKind::Unreachable: return "unreachable";
        case UpsErrorKind::Transport: return "transport";
        case UpsErrorKind::Query: return "query";
    }
    return "unknown";
}

UpsClient::UpsClient(std::string hostname,
                     std::shared_ptr<core::ISnmpService> snmp,
                     UpsClientOptions options,
                     std::shared_ptr<core::IPingService> ping)
    : hostname_(std::move(hostname)), options_(std::move(options)), snmp_(std::move(snmp)),
      ping_(std::move(ping)) {
    if (!snmp_) {
        throw std::invalid_argument("UpsClient requires an SNMP service");
    }
    resolveAddress();
}

void UpsClient::resolveAddress() {
    if (hostname_.empty()) {
        setError(UpsErrorKind::Configuration, "No UPS hostname specified.");
        return;
    }

    asio::io_context context;
    asio::ip::udp::resolver resolver(context);
    asio::error_code ec;
    auto endpoints = resolver.resolve(asio::ip::udp::v4(), hostname_, "", ec);
    if (ec || endpoints.empty()) {
        spdlog::debug("Resolving {} failed: {}", hostname_, ec ? ec.message() : "no addresses");
        setError(UpsErrorKind::Resolution, "Can't resolve: " + hostname_);
        return;
    }

    address_ = endpoints.begin()->endpoint().address().to_string();
    spdlog::debug("Resolved {} to {}", hostname_, address_);
}

void UpsClient::setError(UpsErrorKind kind, std::string message) {
    spdlog::debug("UPS {} {} error: {}", hostname_, upsErrorKindToString(kind), message);
    error_ = UpsError{kind, std::move(message)};
}

bool UpsClient::loadObjectIds() {
    if (!objectIds_.empty()) {
        return true;
    }

    MibResolver mib;
    if (!mib.loadFile(options_.mibPath)) {
        setError(UpsErrorKind::Configuration,
                 "Can't read MIB: '" + options_.mibPath + "'. Maybe you need to download it from '" +
                     MibResolver::MIB_DOWNLOAD_URL + "'?");
        return false;
    }

    std::vector<std::string> oids;
    oids.reserve(core::kQueryAttributes.size());
    for (auto attribute : core::kQueryAttributes) {
        auto oid = mib.resolve(std::string(attribute));
        if (!oid) {
            setError(UpsErrorKind::Configuration,
                     "MIB does not define: " + std::string(attribute));
            return false;
        }
        oids.push_back(std::move(*oid));
    }

    objectIds_ = std::move(oids);
    return true;
}

bool UpsClient::query() {
    if (error_ && error_->isPermanent()) {
        return false;
    }
    error_.reset();

    if (!loadObjectIds()) {
        return false;
    }

    core::SnmpDeviceConfig config;
    config.community = options_.community;
    config.port = options_.port;
    config.version = options_.version;

    spdlog::debug("Querying {} ({}) with SNMP {}, community '{}'", hostname_, address_,
                  core::snmpVersionToString(config.version), config.community);

    auto result = snmp_->getNext(address_, objectIds_, config);
    if (!result.success) {
        spdlog::error("SNMP query of {} ({}) failed: {}", hostname_, address_,
                      result.errorMessage);
        if (result.failure == core::SnmpFailure::Transport) {
            setError(UpsErrorKind::Transport, kUnableToSnmp);
        } else {
            setError(UpsErrorKind::Query, kUnableToFetch);
        }
        return false;
    }

    if (result.varbinds.empty()) {
        spdlog::error("SNMP response from {} carried no values", hostname_);
        setError(UpsErrorKind::Query, kUnableToFetch);
        return false;
    }

    core::RawStatus raw;
    for (size_t i = 0; i < core::kQueryAttributes.size(); ++i) {
        std::string attribute(core::kQueryAttributes[i]);
        core::AttributeValue value = std::monostate{};

        if (i < result.varbinds.size()) {
            const auto& varbind = result.varbinds[i];
            // GET-NEXT may walk past the object if the agent lacks it
            if (BerCodec::isOidPrefix(objectIds_[i], varbind.oid)) {
                spdlog::debug("{} is {}", varbind.oid, core::snmpDataTypeToString(varbind.type));
                value = toAttributeValue(varbind);
            } else {
                spdlog::debug("{} not supplied (got {})", attribute, varbind.oid);
            }
        }

        spdlog::debug("{} = {}", attribute, core::attributeValueToString(value));
        raw[attribute] = std::move(value);
    }

    raw_ = std::move(raw);
    status_ = core::StatusDecoder::decode(raw_);
    lastQuery_ = std::chrono::system_clock::now();
    return true;
}

bool UpsClient::ensureQueried() {
    if (!error_ && !lastQuery_) {
        query();
    }
    return !error_;
}

bool UpsClient::checkReachable(std::chrono::milliseconds timeout) {
    if (error_ && error_->isPermanent()) {
        return false;
    }

    if (!ping_) {
        ping_ = std::make_shared<PingService>();
    }

    auto result = ping_->ping(address_, timeout);
    if (!result.success) {
        spdlog::debug("Ping of {} failed: {}", address_, result.errorMessage);
        setError(UpsErrorKind::Unreachable, hostname_ + " (" + address_ + ") not reachable.");
        return false;
    }
    return true;
}

std::optional<std::string> UpsClient::hostname() const {
    if (error_) {
        return std::nullopt;
    }
    return hostname_;
}

std::optional<std::string> UpsClient::address() const {
    if (error_) {
        return std::nullopt;
    }
    return address_;
}

std::optional<std::string> UpsClient::text(const char* attribute) {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto value = status_.value(attribute);
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    return core::attributeValueToString(value);
}

std::optional<std::string> UpsClient::date(const char* attribute) {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto value = status_.date(attribute);
    if (!value) {
        return std::nullopt;
    }
    return core::formatDate(*value);
}

std::optional<double> UpsClient::percentage(const char* attribute) {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto value = status_.integer(attribute);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<double>(*value) / 100.0;
}

std::optional<bool> UpsClient::onBattery() {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto state = status_.text(core::UpsAttributes::OUTPUT_STATUS);
    if (!state || *state == core::UpsStates::OUTPUT_UNKNOWN) {
        return std::nullopt;
    }
    // Undecoded codes stay integers and were rejected by text() above
    return *state == core::UpsStates::OUTPUT_ON_BATTERY ||
           *state == core::UpsStates::OUTPUT_ON_SMART_BOOST;
}

std::optional<bool> UpsClient::needsNewBattery() {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto indicator = status_.text(core::UpsAttributes::BATTERY_REPLACE_INDICATOR);
    if (!indicator) {
        return std::nullopt;
    }
    if (*indicator == core::UpsStates::BATTERY_NEEDS_REPLACING) {
        return true;
    }
    if (*indicator == core::UpsStates::NO_BATTERY_NEEDS_REPLACING) {
        return false;
    }
    return std::nullopt;
}

std::optional<std::chrono::seconds> UpsClient::runtime() {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    auto ticks = status_.integer(core::UpsAttributes::BATTERY_RUNTIME_REMAINING);
    if (!ticks) {
        return std::nullopt;
    }
    return std::chrono::seconds(*ticks / 100);
}

std::optional<double> UpsClient::charge() {
    return percentage(core::UpsAttributes::BATTERY_CAPACITY);
}

std::optional<double> UpsClient::load() {
    return percentage(core::UpsAttributes::OUTPUT_LOAD);
}

std::optional<std::string> UpsClient::model() {
    return text(core::UpsAttributes::IDENT_MODEL);
}

std::optional<std::string> UpsClient::serial() {
    return text(core::UpsAttributes::IDENT_SERIAL_NUMBER);
}

std::optional<std::string> UpsClient::name() {
    return text(core::UpsAttributes::IDENT_NAME);
}

std::optional<int64_t> UpsClient::temperature() {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    return status_.integer(core::UpsAttributes::BATTERY_TEMPERATURE);
}

std::optional<std::string> UpsClient::firmwareRevision() {
    return text(core::UpsAttributes::IDENT_FIRMWARE_REVISION);
}

std::optional<std::string> UpsClient::birthday() {
    return date(core::UpsAttributes::IDENT_DATE_OF_MANUFACTURE);
}

std::optional<std::string> UpsClient::lastBatteryReplacement() {
    return date(core::UpsAttributes::BATTERY_LAST_REPLACE_DATE);
}

std::optional<core::UpsStatus> UpsClient::status() {
    if (!ensureQueried()) {
        return std::nullopt;
    }
    return status_;
}

} // namespace apcups::infra
