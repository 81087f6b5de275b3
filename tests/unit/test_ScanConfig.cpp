#include <catch2/catch_test_macros.hpp>

#include "core/types/ScanConfig.hpp"

using namespace eyes::core;

namespace {

ScanConfig validConfig() {
    ScanConfig config;
    config.targetAddress = "127.0.0.1";
    config.ports = parsePortSpec(DefaultPortSpec);
    return config;
}

} // namespace

TEST_CASE("ScanConfig default values", "[ScanConfig]") {
    ScanConfig config;

    REQUIRE(config.targetAddress.empty());
    REQUIRE(config.ports.empty());
    REQUIRE(config.concurrency == 1000);
    REQUIRE(config.timeout == std::chrono::seconds{3});
    REQUIRE_FALSE(config.verbose);
    REQUIRE(config.format == OutputFormat::Text);
}

TEST_CASE("ScanConfig validate", "[ScanConfig]") {
    SECTION("Valid configuration passes") {
        REQUIRE_NOTHROW(validConfig().validate());
    }

    SECTION("Missing target") {
        auto config = validConfig();
        config.targetAddress.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Empty port set") {
        auto config = validConfig();
        config.ports.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Port zero") {
        auto config = validConfig();
        config.ports.insert(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Non-positive concurrency") {
        auto config = validConfig();
        config.concurrency = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
        config.concurrency = -4;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Zero timeout") {
        auto config = validConfig();
        config.timeout = std::chrono::seconds{0};
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }
}

TEST_CASE("ScanConfig output format conversion", "[ScanConfig]") {
    REQUIRE(ScanConfig::formatFromString("text") == OutputFormat::Text);
    REQUIRE(ScanConfig::formatFromString("json") == OutputFormat::Json);
    REQUIRE_THROWS_AS(ScanConfig::formatFromString("xml"), ConfigError);
}
