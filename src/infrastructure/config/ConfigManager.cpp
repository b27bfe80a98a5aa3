#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace apcups::infra {

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

std::filesystem::path ConfigManager::defaultConfigPath() {
    const char* env = std::getenv(CONFIG_ENV_VAR);
    if (env != nullptr && *env != '\0') {
        return env;
    }
    return DEFAULT_CONFIG_PATH;
}

bool ConfigManager::load() {
    lastError_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec)) {
        spdlog::debug("Config file {} not found, using defaults", configPath_.string());
        return true;
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            lastError_ = "Failed to open config file: " + configPath_.string();
            spdlog::debug(lastError_);
            return false;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        lastError_ = "Failed to load config " + configPath_.string() + ": " + e.what();
        spdlog::debug(lastError_);
        return false;
    }
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig loaded;

    // SNMP
    if (j.contains("snmp")) {
        const auto& s = j["snmp"];
        loaded.community = s.value("community", loaded.community);
        int port = s.value("port", static_cast<int>(loaded.port));
        if (port <= 0 || port > 65535) {
            throw std::runtime_error("snmp.port out of range: " + std::to_string(port));
        }
        loaded.port = static_cast<uint16_t>(port);

        if (s.contains("version")) {
            auto version = s["version"].get<std::string>();
            loaded.version = core::snmpVersionFromString(version);
            // snmpVersionFromString falls back to v1 for anything it does not know
            if (loaded.version == core::SnmpVersion::V1 && version != "v1" && version != "1") {
                throw std::runtime_error("snmp.version not supported: " + version);
            }
        }
    }

    // MIB
    if (j.contains("mib")) {
        loaded.mibPath = j["mib"].value("path", loaded.mibPath);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        loaded.logLevel = l.value("level", loaded.logLevel);
        loaded.logFile = l.value("file", loaded.logFile);
    }

    // Only replace the current settings once the whole file has been accepted
    config_ = std::move(loaded);
}

} // namespace apcups::infra
