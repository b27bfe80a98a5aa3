#include <catch2/catch_test_macros.hpp>

#include "FakeSnmpService.hpp"
#include "TestFixtures.hpp"
#include "app/Application.hpp"

#include <sstream>

using namespace apcups::app;
using apcups::test::FakeSnmpService;
using apcups::test::TempDir;

namespace {

constexpr const char* kSmartUpsReport =
    "UPS Address:\t127.0.0.1\n"
    "UPS Runtime:\t3699 seconds\n"
    "UPS Serial:\tAS0123456789\n"
    "UPS Battery:\t 87%\n"
    "UPS Load:\t 42%\n"
    "UPS Model:\tSmart-UPS 1500\n"
    "UPS Name:\tups-rack-1\n"
    "UPS Birthday:\t1999-01-02\n"
    "UPS Temp:\t31C\n"
    "UPS does not need battery replacement.\n"
    "UPS is presently running on battery power.\n";

struct AppFixture {
    AppFixture() : agent(std::make_shared<FakeSnmpService>(apcups::test::powerNetResolver())) {
        apcups::test::populateSmartUps(*agent);
        auto mib = dir.write("powernet.mib", apcups::test::powerNetMib());
        configPath = dir.write("config.json",
                               R"({ "snmp": { "community": "from-config" }, "mib": { "path": ")" +
                                   mib.string() + R"(" } })")
                         .string();
    }

    int run(std::vector<std::string> args) {
        Application app(std::move(args), agent);
        return app.run(out, err);
    }

    TempDir dir;
    std::shared_ptr<FakeSnmpService> agent;
    std::string configPath;
    std::ostringstream out;
    std::ostringstream err;
};

} // namespace

TEST_CASE("Application argument parsing", "[Application]") {
    std::string error;

    SECTION("Host only") {
        auto cmd = Application::parseArguments({"ups1"}, error);
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->host == "ups1");
        REQUIRE_FALSE(cmd->community.has_value());
        REQUIRE_FALSE(cmd->ping);
        REQUIRE_FALSE(cmd->verbose);
        REQUIRE_FALSE(cmd->configPath.has_value());
    }

    SECTION("All options") {
        auto cmd = Application::parseArguments(
            {"--ping", "--verbose", "--config", "/tmp/c.json", "ups1", "secret"}, error);
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->ping);
        REQUIRE(cmd->verbose);
        REQUIRE(cmd->configPath == "/tmp/c.json");
        REQUIRE(cmd->host == "ups1");
        REQUIRE(cmd->community == "secret");
    }

    SECTION("SNMP version from the configuration") {
        auto config = fixture.dir.write(
            "v2c.json", R"({ "snmp": { "version": "v2c" }, "mib": { "path": ")" +
                            (fixture.dir.path() / "powernet.mib").string() + R"(" } })");

        REQUIRE(fixture.run({"--config", config.string(), "127.0.0.1"}) == Application::EXIT_OK);
        REQUIRE(fixture.agent->lastConfig.version == apcups::core::SnmpVersion::V2c);
    }

    SECTION("Help") {
        auto cmd = Application::parseArguments({"--help"}, error);
        REQUIRE(cmd.has_value());
        REQUIRE(cmd->help);
    }

    SECTION("Usage errors") {
        REQUIRE_FALSE(Application::parseArguments({}, error).has_value());
        REQUIRE(error == "Missing UPS host");

        REQUIRE_FALSE(Application::parseArguments({"ups1", "public", "extra"}, error).has_value());
        REQUIRE(error == "Unexpected argument: extra");

        REQUIRE_FALSE(Application::parseArguments({"--bogus", "ups1"}, error).has_value());
        REQUIRE(error == "Unknown option: --bogus");

        REQUIRE_FALSE(Application::parseArguments({"ups1", "--config"}, error).has_value());
        REQUIRE(error == "--config requires a file argument");
    }
}

TEST_CASE("Application report format", "[Application]") {
    SECTION("Complete report") {
        UpsReport report;
        report.hostname = "127.0.0.1";
        report.runtime = std::chrono::seconds(3699);
        report.serial = "AS0123456789";
        report.charge = 0.87;
        report.load = 0.42;
        report.model = "Smart-UPS 1500";
        report.name = "ups-rack-1";
        report.birthday = "1999-01-02";
        report.temperature = 31;
        report.needsNewBattery = false;
        report.onBattery = true;

        REQUIRE(Application::formatReport(report) == kSmartUpsReport);
    }

    SECTION("Full charge and battery replacement") {
        UpsReport report;
        report.charge = 1.0;
        report.load = 0.05;
        report.needsNewBattery = true;
        report.onBattery = false;

        auto text = Application::formatReport(report);
        REQUIRE(text.find("UPS Battery:\t100%\n") != std::string::npos);
        REQUIRE(text.find("UPS Load:\t  5%\n") != std::string::npos);
        REQUIRE(text.find("UPS does need battery replacement.\n") != std::string::npos);
        REQUIRE(text.find("UPS is presently running on input power.\n") != std::string::npos);
    }

    SECTION("Undefined values") {
        auto text = Application::formatReport(UpsReport{});
        REQUIRE(text.find("UPS Runtime:\t seconds\n") != std::string::npos);
        REQUIRE(text.find("UPS Battery:\t  0%\n") != std::string::npos);
        REQUIRE(text.find("UPS Temp:\tC\n") != std::string::npos);
        REQUIRE(text.find("UPS does not need battery replacement.\n") != std::string::npos);
        REQUIRE(text.find("UPS is presently running on input power.\n") != std::string::npos);
    }
}

TEST_CASE("Application run", "[Application]") {
    AppFixture fixture;

    SECTION("Prints the report") {
        REQUIRE(fixture.run({"--config", fixture.configPath, "127.0.0.1"}) == Application::EXIT_OK);
        REQUIRE(fixture.out.str() == kSmartUpsReport);
        REQUIRE(fixture.err.str().empty());
        REQUIRE(fixture.agent->lastConfig.community == "from-config");
    }

    SECTION("Community argument overrides the configuration") {
        REQUIRE(fixture.run({"--config", fixture.configPath, "127.0.0.1", "cli-community"}) ==
                Application::EXIT_OK);
        REQUIRE(fixture.agent->lastConfig.community == "cli-community");
    }

    SECTION("Help") {
        REQUIRE(fixture.run({"--help"}) == Application::EXIT_OK);
        REQUIRE(fixture.out.str() == Application::usage());
    }

    SECTION("Usage error") {
        REQUIRE(fixture.run({}) == Application::EXIT_USAGE);
        REQUIRE(fixture.err.str().find("Missing UPS host") != std::string::npos);
        REQUIRE(fixture.out.str().empty());
    }

    SECTION("Unresolvable host") {
        REQUIRE(fixture.run({"--config", fixture.configPath, "no-such-host.invalid"}) ==
                Application::EXIT_ERROR);
        REQUIRE(fixture.err.str() == "Can't resolve: no-such-host.invalid\n");
        REQUIRE(fixture.out.str().empty());
        REQUIRE(fixture.agent->getNextCalls == 0);
    }

    SECTION("Agent does not answer") {
        fixture.agent->failure = apcups::core::SnmpFailure::Timeout;

        REQUIRE(fixture.run({"--config", fixture.configPath, "127.0.0.1"}) ==
                Application::EXIT_ERROR);
        REQUIRE(fixture.err.str() == "Unable to fetch UPS parameters.\n");
        REQUIRE(fixture.out.str().empty());
    }

    SECTION("Missing MIB") {
        auto config = fixture.dir.write(
            "nomib.json", R"({ "mib": { "path": "/nonexistent/powernet381.mib" } })");

        REQUIRE(fixture.run({"--config", config.string(), "127.0.0.1"}) == Application::EXIT_ERROR);
        REQUIRE(fixture.err.str().find("Can't read MIB: '/nonexistent/powernet381.mib'") == 0);
    }

    SECTION("Malformed configuration") {
        auto config = fixture.dir.write("broken.json", "{ not json");

        REQUIRE(fixture.run({"--config", config.string(), "127.0.0.1"}) == Application::EXIT_ERROR);
        REQUIRE(fixture.err.str().find("Failed to load config") == 0);
        REQUIRE(fixture.agent->getNextCalls == 0);
    }
}
