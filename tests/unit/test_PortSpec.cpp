#include <catch2/catch_test_macros.hpp>

#include "core/types/PortSpec.hpp"

#include <string>
#include <vector>

using namespace eyes::core;

TEST_CASE("parsePortSpec single ports and ranges", "[PortSpec]") {
    SECTION("Mixed singles and range") {
        auto ports = parsePortSpec("22,80,8000-8002");
        REQUIRE(ports == PortSet{22, 80, 8000, 8001, 8002});
    }

    SECTION("Single port") {
        REQUIRE(parsePortSpec("8080") == PortSet{8080});
    }

    SECTION("Single range") {
        auto ports = parsePortSpec("1-1024");
        REQUIRE(ports.size() == 1024);
        REQUIRE(*ports.begin() == 1);
        REQUIRE(*ports.rbegin() == 1024);
    }

    SECTION("Default specification") {
        REQUIRE(parsePortSpec(DefaultPortSpec).size() == 1024);
    }

    SECTION("Full port domain") {
        auto ports = parsePortSpec("1-65535");
        REQUIRE(ports.size() == 65535);
        REQUIRE(*ports.begin() == 1);
        REQUIRE(*ports.rbegin() == 65535);
    }

    SECTION("Degenerate range") {
        REQUIRE(parsePortSpec("443-443") == PortSet{443});
    }

    SECTION("Whitespace around tokens is ignored") {
        REQUIRE(parsePortSpec(" 22 , 80 - 82 ") == PortSet{22, 80, 81, 82});
    }
}

TEST_CASE("parsePortSpec deduplicates", "[PortSpec]") {
    SECTION("Repeated singles") {
        REQUIRE(parsePortSpec("80,80,80") == PortSet{80});
    }

    SECTION("Overlapping ranges and singles") {
        auto ports = parsePortSpec("20-25,22,24-30");
        REQUIRE(ports.size() == 11);
        REQUIRE(*ports.begin() == 20);
        REQUIRE(*ports.rbegin() == 30);
    }

    SECTION("Members are in ascending order") {
        auto ports = parsePortSpec("9000,22,443,80");
        std::vector<uint16_t> ordered(ports.begin(), ports.end());
        REQUIRE(ordered == std::vector<uint16_t>{22, 80, 443, 9000});
    }
}

TEST_CASE("parsePortSpec rejects malformed tokens", "[PortSpec]") {
    auto reasonOf = [](std::string_view spec) {
        try {
            parsePortSpec(spec);
        } catch (const ParseError& e) {
            return e.reason();
        }
        FAIL("Expected ParseError for '" << spec << "'");
        return ParseErrorReason::Empty;
    };

    SECTION("Inverted range") {
        REQUIRE(reasonOf("80-22") == ParseErrorReason::InvertedRange);
    }

    SECTION("Non-numeric") {
        REQUIRE(reasonOf("http") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("22,abc") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("1-2-3") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("-80") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("80-") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("+80") == ParseErrorReason::NonNumeric);
        REQUIRE(reasonOf("8 0") == ParseErrorReason::NonNumeric);
    }

    SECTION("Out of range") {
        REQUIRE(reasonOf("0") == ParseErrorReason::OutOfRange);
        REQUIRE(reasonOf("65536") == ParseErrorReason::OutOfRange);
        REQUIRE(reasonOf("1-70000") == ParseErrorReason::OutOfRange);
        REQUIRE(reasonOf("99999999999999999999") == ParseErrorReason::OutOfRange);
        REQUIRE(reasonOf("0000") == ParseErrorReason::OutOfRange);
        REQUIRE(reasonOf("0065536") == ParseErrorReason::OutOfRange);
    }

    SECTION("Empty") {
        REQUIRE(reasonOf("") == ParseErrorReason::Empty);
        REQUIRE(reasonOf("   ") == ParseErrorReason::Empty);
        REQUIRE(reasonOf("22,,80") == ParseErrorReason::Empty);
        REQUIRE(reasonOf("22,") == ParseErrorReason::Empty);
        REQUIRE(reasonOf(",22") == ParseErrorReason::Empty);
    }
}

TEST_CASE("parsePortSpec accepts leading zeros", "[PortSpec]") {
    REQUIRE(parsePortSpec("000080") == PortSet{80});
    REQUIRE(parsePortSpec("0000000000443") == PortSet{443});
    REQUIRE(parsePortSpec("0022-00024") == PortSet{22, 23, 24});
    REQUIRE(parsePortSpec("065535") == PortSet{65535});
}

TEST_CASE("ParseError identifies the offending token", "[PortSpec]") {
    SECTION("Malformed token") {
        try {
            parsePortSpec("22,80-21,443");
            FAIL("Expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.token() == "80-21");
            REQUIRE(e.position() == 2);
            REQUIRE(e.reason() == ParseErrorReason::InvertedRange);
            REQUIRE(std::string(e.what()).find("80-21") != std::string::npos);
        }
    }

    SECTION("Empty token between commas") {
        try {
            parsePortSpec("22,,80");
            FAIL("Expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.token().empty());
            REQUIRE(e.position() == 2);
            REQUIRE(std::string(e.what()).find("empty token at position 2") !=
                    std::string::npos);
        }
    }

    SECTION("Trailing comma") {
        try {
            parsePortSpec("22,443,");
            FAIL("Expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.position() == 3);
            REQUIRE(std::string(e.what()).find("position 3") != std::string::npos);
        }
    }
}

TEST_CASE("ParseError reason strings", "[PortSpec]") {
    REQUIRE_FALSE(ParseError::reasonToString(ParseErrorReason::Empty).empty());
    REQUIRE(ParseError::reasonToString(ParseErrorReason::OutOfRange).find("65535") !=
            std::string::npos);
    REQUIRE(ParseError::reasonToString(ParseErrorReason::InvertedRange) !=
            ParseError::reasonToString(ParseErrorReason::NonNumeric));
}

TEST_CASE("formatPortSet", "[PortSpec]") {
    SECTION("Empty set") {
        REQUIRE(formatPortSet({}).empty());
    }

    SECTION("Singles and runs") {
        REQUIRE(formatPortSet({22, 80, 8000, 8001, 8002}) == "22,80,8000-8002");
    }

    SECTION("Full domain collapses to one range") {
        REQUIRE(formatPortSet(parsePortSpec("1-65535")) == "1-65535");
    }

    SECTION("Output parses back to the same set") {
        auto ports = parsePortSpec("1-3,7,9-12,65535");
        REQUIRE(parsePortSpec(formatPortSet(ports)) == ports);
    }
}
