#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace apcups::infra {

/**
 * @brief Application configuration settings.
 *
 * SNMP session defaults, MIB location and logging preferences. Timeout and
 * retry counts are fixed by the SNMP layer and not configurable.
 */
struct AppConfig {
    // SNMP
    std::string community{"public"}; ///< Default community string.
    uint16_t port{161};              ///< Agent UDP port.
    core::SnmpVersion version{core::SnmpVersion::V1}; ///< Protocol version, "v1" or "v2c".

    // MIB
    std::string mibPath{"/usr/share/snmp/mibs/powernet381.mib"}; ///< PowerNet MIB file.

    // Logging
    std::string logLevel{"warn"}; ///< spdlog level name for the console sink.
    std::string logFile;          ///< Rotating log file; empty disables file logging.

    bool operator==(const AppConfig& other) const = default;
};

/**
 * @brief Loads application configuration from a JSON file.
 *
 * A missing file is not an error: the defaults of AppConfig apply.
 */
class ConfigManager {
public:
    /**
     * @brief Location used when neither --config nor $APCUPS_CONFIG is given.
     */
    static constexpr const char* DEFAULT_CONFIG_PATH = "/etc/apcups/config.json";

    /**
     * @brief Environment variable naming an alternative configuration file.
     */
    static constexpr const char* CONFIG_ENV_VAR = "APCUPS_CONFIG";

    /**
     * @brief Constructs a ConfigManager for the specified file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Returns the configuration path to use when none was given
     *        on the command line.
     * @return $APCUPS_CONFIG if set and non-empty, else DEFAULT_CONFIG_PATH.
     */
    static std::filesystem::path defaultConfigPath();

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded (or the file does not exist), false if the file
     *         could not be read or is not valid configuration JSON. The
     *         failure is left to the caller to report (see lastError()).
     */
    bool load();

    /**
     * @brief Returns a mutable reference to the configuration.
     */
    AppConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     */
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     */
    const std::filesystem::path& configPath() const { return configPath_; }

    /**
     * @brief Returns the reason the last load() failed.
     */
    const std::string& lastError() const { return lastError_; }

private:
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configPath_;
    AppConfig config_;
    std::string lastError_;
};

} // namespace apcups::infra
