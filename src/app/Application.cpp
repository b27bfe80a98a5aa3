#include "app/Application.hpp"

#include "infrastructure/network/SnmpService.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <ostream>

namespace apcups::app {

namespace {

constexpr size_t kLogFileSize = 5 * 1024 * 1024;
constexpr size_t kLogFileCount = 3;
constexpr auto kPingTimeout = std::chrono::milliseconds(1000);

} // namespace

Application::Application(std::vector<std::string> args, std::shared_ptr<core::ISnmpService> snmp)
    : args_(std::move(args)), snmp_(std::move(snmp)) {}

std::string Application::usage() {
    return "Usage: apcups-query [--ping] [--verbose] [--config <file>] <host> [community]\n"
           "\n"
           "  --ping           check that the UPS answers ICMP echo before querying\n"
           "  --verbose        log debug output to stderr\n"
           "  --config <file>  configuration file (default: $APCUPS_CONFIG or "
           "/etc/apcups/config.json)\n"
           "  -h, --help       show this help\n";
}

std::optional<CommandLine> Application::parseArguments(const std::vector<std::string>& args,
                                                       std::string& error) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--ping") {
            cmd.ping = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
            return cmd;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a file argument";
                return std::nullopt;
            }
            cmd.configPath = args[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        error = "Missing UPS host";
        return std::nullopt;
    }
    if (positional.size() > 2) {
        error = "Unexpected argument: " + positional[2];
        return std::nullopt;
    }

    cmd.host = positional[0];
    if (positional.size() == 2) {
        cmd.community = positional[1];
    }
    return cmd;
}

void Application::initializeLogging(bool verbose) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    auto logger = std::make_shared<spdlog::logger>("apcups", consoleSink);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void Application::attachFileLog(const infra::AppConfig& config, bool verbose) {
    auto logger = spdlog::default_logger();

    if (!verbose) {
        auto level = spdlog::level::from_str(config.logLevel);
        if (level == spdlog::level::off && config.logLevel != "off") {
            spdlog::warn("Unknown log level '{}', keeping warn", config.logLevel);
        } else {
            logger->sinks().front()->set_level(level);
            logger->set_level(level);
        }
    }

    if (config.logFile.empty()) {
        return;
    }

    try {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, kLogFileSize, kLogFileCount);
        fileSink->set_level(spdlog::level::debug);
        logger->sinks().push_back(fileSink);
        logger->set_level(spdlog::level::debug);
        spdlog::debug("Log file: {}", config.logFile);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Cannot open log file {}: {}", config.logFile, e.what());
    }
}

int Application::run(std::ostream& out, std::ostream& err) {
    std::string usageError;
    auto cmd = parseArguments(args_, usageError);
    if (!cmd) {
        err << usageError << "\n" << usage();
        return EXIT_USAGE;
    }
    if (cmd->help) {
        out << usage();
        return EXIT_OK;
    }

    initializeLogging(cmd->verbose);

    infra::ConfigManager config(cmd->configPath ? std::filesystem::path(*cmd->configPath)
                                                : infra::ConfigManager::defaultConfigPath());
    if (!config.load()) {
        err << config.lastError() << "\n";
        return EXIT_ERROR;
    }
    attachFileLog(config.config(), cmd->verbose);

    infra::UpsClientOptions options;
    options.community = cmd->community.value_or(config.config().community);
    options.port = config.config().port;
    options.version = config.config().version;
    options.mibPath = config.config().mibPath;

    if (!snmp_) {
        snmp_ = std::make_shared<infra::SnmpService>();
    }

    infra::UpsClient ups(cmd->host, snmp_, options);
    if (ups.error()) {
        err << ups.errorMessage() << "\n";
        return EXIT_ERROR;
    }

    if (cmd->ping && !ups.checkReachable(kPingTimeout)) {
        err << ups.errorMessage() << "\n";
        return EXIT_ERROR;
    }

    if (!ups.query()) {
        err << ups.errorMessage() << "\n";
        return EXIT_ERROR;
    }

    out << formatReport(collectReport(ups));
    return EXIT_OK;
}

UpsReport Application::collectReport(infra::UpsClient& ups) {
    UpsReport report;
    report.hostname = ups.hostname().value_or("");
    report.runtime = ups.runtime();
    report.serial = ups.serial();
    report.charge = ups.charge();
    report.load = ups.load();
    report.model = ups.model();
    report.name = ups.name();
    report.birthday = ups.birthday();
    report.temperature = ups.temperature();
    report.needsNewBattery = ups.needsNewBattery();
    report.onBattery = ups.onBattery();
    return report;
}

std::string Application::formatReport(const UpsReport& report) {
    // Absent values print empty, absent percentages as 0
    auto textOf = [](const std::optional<std::string>& value) { return value.value_or(""); };

    std::string out;
    out += fmt::format("UPS Address:\t{}\n", report.hostname);
    out += fmt::format("UPS Runtime:\t{} seconds\n",
                       report.runtime ? std::to_string(report.runtime->count()) : "");
    out += fmt::format("UPS Serial:\t{}\n", textOf(report.serial));
    out += fmt::format("UPS Battery:\t{:3.0f}%\n", report.charge.value_or(0.0) * 100);
    out += fmt::format("UPS Load:\t{:3.0f}%\n", report.load.value_or(0.0) * 100);
    out += fmt::format("UPS Model:\t{}\n", textOf(report.model));
    out += fmt::format("UPS Name:\t{}\n", textOf(report.name));
    out += fmt::format("UPS Birthday:\t{}\n", textOf(report.birthday));
    out += fmt::format("UPS Temp:\t{}C\n",
                       report.temperature ? std::to_string(*report.temperature) : "");
    out += fmt::format("UPS {} need battery replacement.\n",
                       report.needsNewBattery.value_or(false) ? "does" : "does not");
    out += fmt::format("UPS is presently running on {} power.\n",
                       report.onBattery.value_or(false) ? "battery" : "input");
    return out;
}

} // namespace apcups::app
