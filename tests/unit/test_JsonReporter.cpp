#include <catch2/catch_test_macros.hpp>

#include "core/services/OutcomeChannel.hpp"
#include "infrastructure/output/JsonReporter.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace eyes::core;
using namespace eyes::infra;

namespace {

std::vector<nlohmann::json> parseLines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

} // namespace

TEST_CASE("JsonReporter outcome serialization", "[JsonReporter]") {
    SECTION("Open outcome has no cause") {
        auto outcome = ProbeOutcome::open(22);
        outcome.elapsed = std::chrono::milliseconds{12};

        auto j = JsonReporter::toJson(outcome);
        REQUIRE(j["port"] == 22);
        REQUIRE(j["state"] == "open");
        REQUIRE(j["elapsed_ms"] == 12);
        REQUIRE_FALSE(j.contains("cause"));
    }

    SECTION("Error outcome carries its cause") {
        auto j = JsonReporter::toJson(ProbeOutcome::error(81, "Host is unreachable"));
        REQUIRE(j["state"] == "error");
        REQUIRE(j["cause"] == "Host is unreachable");
    }

    SECTION("Timed out uses an underscore key") {
        auto j = JsonReporter::toJson(ProbeOutcome::timedOut(9));
        REQUIRE(j["state"] == "timed_out");
    }
}

TEST_CASE("JsonReporter summary serialization", "[JsonReporter]") {
    ScanSummary summary;
    summary.totalPorts = 10;
    summary.open = 2;
    summary.closed = 7;
    summary.timedOut = 1;
    summary.cancelled = false;

    auto j = JsonReporter::toJson(summary);
    REQUIRE(j["event"] == "finished");
    REQUIRE(j["total"] == 10);
    REQUIRE(j["open"] == 2);
    REQUIRE(j["closed"] == 7);
    REQUIRE(j["timed_out"] == 1);
    REQUIRE(j["errors"] == 0);
    REQUIRE(j["cancelled"] == false);
}

TEST_CASE("JsonReporter stream filtering", "[JsonReporter]") {
    ScanConfig config;
    config.targetAddress = "127.0.0.1";
    config.ports = parsePortSpec("1-3");

    auto run = [&config](bool verbose) {
        std::ostringstream out;
        JsonReporter reporter(out, verbose);
        OutcomeChannel channel;
        channel.push(ProbeOutcome::closed(1));
        channel.push(ProbeOutcome::open(2));
        channel.push(ProbeOutcome::error(3, "boom"));
        channel.close(ScanSummary{});

        reporter.onStart(config);
        reporter.consume(channel);
        return parseLines(out.str());
    };

    SECTION("Non-verbose emits open, errors and the finish event") {
        auto lines = run(false);
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0]["port"] == 2);
        REQUIRE(lines[1]["port"] == 3);
        REQUIRE(lines[2]["event"] == "finished");
    }

    SECTION("Verbose emits the start event and every outcome") {
        auto lines = run(true);
        REQUIRE(lines.size() == 5);
        REQUIRE(lines[0]["event"] == "started");
        REQUIRE(lines[0]["ports"] == 3);
        REQUIRE(lines[1]["state"] == "closed");
        REQUIRE(lines[4]["event"] == "finished");
    }
}
