#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

using namespace mping;
using namespace mping::infra;
using namespace std::chrono_literals;

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    ConfigManager manager;
    manager.parse(std::vector<std::string>{});
    const auto& config = manager.config();

    REQUIRE(config.hostsFile.string() == "hosts.txt");
    REQUIRE(config.interval == 5000ms);
    REQUIRE(config.sortKey == core::SortKey::Name);
    REQUIRE(config.probeTimeout == 2000ms);
    REQUIRE(config.workerCount == 32);
    REQUIRE(config.logFile.string() == "mping.log");
    REQUIRE(config.logLevel == spdlog::level::info);
    REQUIRE(config.color);
    REQUIRE_FALSE(config.showHelp);
}

TEST_CASE("ConfigManager options", "[ConfigManager]") {
    ConfigManager manager;

    SECTION("Separate values") {
        manager.parse({"-f", "lab.txt", "-i", "1.5", "--sort", "reply", "--timeout", "800",
                       "--workers", "4", "--log-file", "/tmp/mping-test.log", "--log-level",
                       "debug", "--no-color"});
        const auto& config = manager.config();

        REQUIRE(config.hostsFile.string() == "lab.txt");
        REQUIRE(config.interval == 1500ms);
        REQUIRE(config.sortKey == core::SortKey::Latency);
        REQUIRE(config.probeTimeout == 800ms);
        REQUIRE(config.workerCount == 4);
        REQUIRE(config.logFile.string() == "/tmp/mping-test.log");
        REQUIRE(config.logLevel == spdlog::level::debug);
        REQUIRE_FALSE(config.color);
    }

    SECTION("Inline values") {
        manager.parse({"--hosts=dc.txt", "--interval=0,5", "--sort=ip", "--log-level=off"});
        const auto& config = manager.config();

        REQUIRE(config.hostsFile.string() == "dc.txt");
        REQUIRE(config.interval == 500ms);
        REQUIRE(config.sortKey == core::SortKey::Address);
        REQUIRE(config.logLevel == spdlog::level::off);
    }

    SECTION("Help") {
        manager.parse({"--help"});
        REQUIRE(manager.config().showHelp);
    }

    SECTION("argc/argv form skips the program name") {
        const char* argv[] = {"mping", "-i", "2", "--sort", "age"};
        manager.parse(5, argv);
        REQUIRE(manager.config().interval == 2000ms);
        REQUIRE(manager.config().sortKey == core::SortKey::Age);
    }
}

TEST_CASE("ConfigManager rejects bad input", "[ConfigManager]") {
    ConfigManager manager;

    REQUIRE_THROWS_AS(manager.parse({"--bogus"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"-i"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"-i", "0.4"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"-i", "5.5"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"-i", "fast"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--sort", "size"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--timeout", "50"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--timeout", "1s"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--workers", "0"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--workers", "1000"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--log-level", "loud"}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--hosts="}), std::invalid_argument);
    REQUIRE_THROWS_AS(manager.parse({"--no-color=yes"}), std::invalid_argument);
}

TEST_CASE("ConfigManager usage text", "[ConfigManager]") {
    auto text = ConfigManager::usage("mping");
    REQUIRE(text.rfind("Usage: mping", 0) == 0);
    REQUIRE(text.find("--interval") != std::string::npos);
    REQUIRE(text.find("--sort") != std::string::npos);
}
