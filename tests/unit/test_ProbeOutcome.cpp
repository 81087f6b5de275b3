#include <catch2/catch_test_macros.hpp>

#include "core/types/ProbeOutcome.hpp"

using namespace eyes::core;

TEST_CASE("ProbeOutcome default values", "[ProbeOutcome]") {
    ProbeOutcome outcome;

    REQUIRE(outcome.port == 0);
    REQUIRE(outcome.state == ProbeState::Error);
    REQUIRE(outcome.cause.empty());
    REQUIRE(outcome.elapsed.count() == 0);
}

TEST_CASE("ProbeOutcome factories", "[ProbeOutcome]") {
    SECTION("open") {
        auto outcome = ProbeOutcome::open(22);
        REQUIRE(outcome.port == 22);
        REQUIRE(outcome.state == ProbeState::Open);
        REQUIRE(outcome.cause.empty());
    }

    SECTION("closed keeps the refusal text") {
        auto outcome = ProbeOutcome::closed(23, "Connection refused");
        REQUIRE(outcome.state == ProbeState::Closed);
        REQUIRE(outcome.cause == "Connection refused");
    }

    SECTION("timedOut") {
        auto outcome = ProbeOutcome::timedOut(24);
        REQUIRE(outcome.port == 24);
        REQUIRE(outcome.state == ProbeState::TimedOut);
    }

    SECTION("error carries its cause") {
        auto outcome = ProbeOutcome::error(25, "Network is unreachable");
        REQUIRE(outcome.state == ProbeState::Error);
        REQUIRE(outcome.cause == "Network is unreachable");
    }
}

TEST_CASE("ProbeOutcome state string conversion", "[ProbeOutcome]") {
    SECTION("stateToString instance method") {
        ProbeOutcome outcome;

        outcome.state = ProbeState::Open;
        REQUIRE(outcome.stateToString() == "open");

        outcome.state = ProbeState::Closed;
        REQUIRE(outcome.stateToString() == "closed");

        outcome.state = ProbeState::TimedOut;
        REQUIRE(outcome.stateToString() == "timed out");

        outcome.state = ProbeState::Error;
        REQUIRE(outcome.stateToString() == "error");
    }

    SECTION("probeStateKey") {
        REQUIRE(ProbeOutcome::probeStateKey(ProbeState::Open) == "open");
        REQUIRE(ProbeOutcome::probeStateKey(ProbeState::Closed) == "closed");
        REQUIRE(ProbeOutcome::probeStateKey(ProbeState::TimedOut) == "timed_out");
        REQUIRE(ProbeOutcome::probeStateKey(ProbeState::Error) == "error");
    }
}

TEST_CASE("ProbeOutcome equality", "[ProbeOutcome]") {
    auto first = ProbeOutcome::open(80);
    auto second = first;
    REQUIRE(first == second);

    second.port = 443;
    REQUIRE_FALSE(first == second);
}

TEST_CASE("ScanSummary counters", "[ScanSummary]") {
    ScanSummary summary;
    REQUIRE(summary.reported() == 0);
    REQUIRE_FALSE(summary.cancelled);

    summary.record(ProbeOutcome::open(1));
    summary.record(ProbeOutcome::open(2));
    summary.record(ProbeOutcome::closed(3));
    summary.record(ProbeOutcome::timedOut(4));
    summary.record(ProbeOutcome::error(5, "boom"));

    REQUIRE(summary.open == 2);
    REQUIRE(summary.closed == 1);
    REQUIRE(summary.timedOut == 1);
    REQUIRE(summary.errors == 1);
    REQUIRE(summary.reported() == 5);
}
