#include "core/types/PortSpec.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace eyes::core {

namespace {

std::string_view trim(std::string_view text) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// Parses one port number; `token` and `position` identify the full token for
// error reporting.
uint16_t parsePort(std::string_view digits, std::string_view token, size_t position) {
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        throw ParseError(std::string(token), ParseErrorReason::NonNumeric, position);
    }

    auto significant = digits.find_first_not_of('0');
    if (significant == std::string_view::npos) {
        throw ParseError(std::string(token), ParseErrorReason::OutOfRange, position);
    }
    digits.remove_prefix(significant);

    // More than five significant digits cannot be a valid port, and would
    // overflow below.
    if (digits.size() > 5) {
        throw ParseError(std::string(token), ParseErrorReason::OutOfRange, position);
    }

    uint32_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }

    if (value < MinPort || value > MaxPort) {
        throw ParseError(std::string(token), ParseErrorReason::OutOfRange, position);
    }
    return static_cast<uint16_t>(value);
}

void parseToken(std::string_view token, size_t position, PortSet& ports) {
    auto dash = token.find('-');
    if (dash == std::string_view::npos) {
        ports.insert(parsePort(token, token, position));
        return;
    }

    if (token.find('-', dash + 1) != std::string_view::npos) {
        throw ParseError(std::string(token), ParseErrorReason::NonNumeric, position);
    }

    uint16_t low = parsePort(trim(token.substr(0, dash)), token, position);
    uint16_t high = parsePort(trim(token.substr(dash + 1)), token, position);
    if (low > high) {
        throw ParseError(std::string(token), ParseErrorReason::InvertedRange, position);
    }

    for (uint32_t port = low; port <= high; ++port) {
        ports.insert(ports.end(), static_cast<uint16_t>(port));
    }
}

} // namespace

namespace {

std::string describe(const std::string& token, ParseErrorReason reason, size_t position) {
    if (reason == ParseErrorReason::Empty) {
        return "invalid port specification: empty token at position " +
               std::to_string(position);
    }
    return "invalid port specification: token " + std::to_string(position) + " '" + token +
           "': " + ParseError::reasonToString(reason);
}

} // namespace

ParseError::ParseError(std::string token, ParseErrorReason reason, size_t position)
    : std::runtime_error(describe(token, reason, position)), token_(std::move(token)),
      reason_(reason), position_(position) {}

std::string ParseError::reasonToString(ParseErrorReason reason) {
    switch (reason) {
    case ParseErrorReason::Empty:
        return "empty token";
    case ParseErrorReason::NonNumeric:
        return "not a number or range";
    case ParseErrorReason::OutOfRange:
        return "port must be between 1 and 65535";
    case ParseErrorReason::InvertedRange:
        return "range start is greater than range end";
    }
    return "unknown error";
}

PortSet parsePortSpec(std::string_view spec) {
    if (trim(spec).empty()) {
        throw ParseError({}, ParseErrorReason::Empty, 1);
    }

    PortSet ports;
    size_t start = 0;
    size_t position = 1;
    while (true) {
        auto comma = spec.find(',', start);
        auto token = trim(spec.substr(start, comma == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : comma - start));
        if (token.empty()) {
            throw ParseError({}, ParseErrorReason::Empty, position);
        }

        parseToken(token, position, ports);

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
        ++position;
    }

    return ports;
}

std::string formatPortSet(const PortSet& ports) {
    std::string out;
    auto it = ports.begin();
    while (it != ports.end()) {
        uint16_t low = *it;
        uint16_t high = low;
        ++it;
        while (it != ports.end() && *it == high + 1) {
            high = *it;
            ++it;
        }

        if (!out.empty()) {
            out += ',';
        }
        out += std::to_string(low);
        if (high != low) {
            out += '-';
            out += std::to_string(high);
        }
    }
    return out;
}

} // namespace eyes::core
