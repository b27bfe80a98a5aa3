#pragma once

#include "core/services/ISnmpService.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/ups/UpsClient.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apcups::app {

/**
 * @brief Parsed apcups-query command line.
 */
struct CommandLine {
    bool ping{false};                     ///< Check reachability before querying
    bool verbose{false};                  ///< Debug logging on stderr
    bool help{false};                     ///< Print usage and exit
    std::optional<std::string> configPath; ///< --config argument
    std::string host;                      ///< UPS hostname or address
    std::optional<std::string> community;  ///< Overrides the configured community
};

/**
 * @brief Values printed by apcups-query.
 */
struct UpsReport {
    std::string hostname;
    std::optional<std::chrono::seconds> runtime;
    std::optional<std::string> serial;
    std::optional<double> charge;
    std::optional<double> load;
    std::optional<std::string> model;
    std::optional<std::string> name;
    std::optional<std::string> birthday;
    std::optional<int64_t> temperature;
    std::optional<bool> needsNewBattery;
    std::optional<bool> onBattery;
};

/**
 * @brief The apcups-query command line tool.
 *
 * Queries one UPS and prints its status. Exit codes: 0 success,
 * 1 configuration, network or UPS error, 2 usage error.
 */
class Application {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_ERROR = 1;
    static constexpr int EXIT_USAGE = 2;

    /**
     * @brief Creates the application.
     * @param args Command line arguments without the program name.
     * @param snmp SNMP transport; an infra::SnmpService if null.
     */
    explicit Application(std::vector<std::string> args,
                         std::shared_ptr<core::ISnmpService> snmp = nullptr);

    /**
     * @brief Runs the query.
     * @param out Receives the report.
     * @param err Receives usage and error messages.
     * @return Process exit code.
     */
    int run(std::ostream& out, std::ostream& err);

    /**
     * @brief Parses command line arguments.
     * @param args Arguments without the program name.
     * @param error Set to the reason on failure.
     * @return The command line, or std::nullopt on a usage error.
     */
    static std::optional<CommandLine> parseArguments(const std::vector<std::string>& args,
                                                     std::string& error);

    /**
     * @brief Returns the usage text.
     */
    static std::string usage();

    /**
     * @brief Reads every reported value from a queried client.
     */
    static UpsReport collectReport(infra::UpsClient& ups);

    /**
     * @brief Renders a report in the apcups-query output format.
     */
    static std::string formatReport(const UpsReport& report);

private:
    void initializeLogging(bool verbose);
    void attachFileLog(const infra::AppConfig& config, bool verbose);

    std::vector<std::string> args_;
    std::shared_ptr<core::ISnmpService> snmp_;
};

} // namespace apcups::app
