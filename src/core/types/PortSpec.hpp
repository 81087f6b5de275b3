/**
 * @file PortSpec.hpp
 * @brief Port specification parsing.
 *
 * Turns a textual port specification such as "22,80,8000-8002" into a
 * concrete, deduplicated set of port numbers.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eyes::core {

/// Unique port numbers, iterated in ascending order. Members are in [1, 65535].
using PortSet = std::set<uint16_t>;

inline constexpr uint32_t MinPort = 1;
inline constexpr uint32_t MaxPort = 65535;

/// The default specification used when none is supplied.
inline constexpr std::string_view DefaultPortSpec = "1-1024";

/**
 * @brief Why a port specification token was rejected.
 */
enum class ParseErrorReason {
    Empty,         ///< Empty specification or empty token between commas
    NonNumeric,    ///< Token is not a number or a well-formed low-high range
    OutOfRange,    ///< Number is outside 1-65535
    InvertedRange  ///< Range with low > high
};

/**
 * @brief Raised when a port specification cannot be parsed.
 *
 * Carries the offending token and its 1-based position in the
 * comma-separated list so the caller can point the user at it.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(std::string token, ParseErrorReason reason, size_t position);

    [[nodiscard]] const std::string& token() const { return token_; }
    [[nodiscard]] ParseErrorReason reason() const { return reason_; }
    [[nodiscard]] size_t position() const { return position_; }

    static std::string reasonToString(ParseErrorReason reason);

private:
    std::string token_;
    ParseErrorReason reason_;
    size_t position_;
};

/**
 * @brief Parses a comma-separated port specification.
 *
 * Each token is either a single port or an inclusive "low-high" range.
 * Whitespace around a token is ignored. Duplicates are merged.
 *
 * @param spec The specification text.
 * @return The parsed set of ports (never empty).
 * @throws ParseError if any token is empty, malformed, out of range or inverted.
 */
PortSet parsePortSpec(std::string_view spec);

/**
 * @brief Renders a port set in compact range notation (e.g. "22,80,8000-8002").
 * @param ports The set to format.
 * @return Comma-separated singles and ranges, empty string for an empty set.
 */
std::string formatPortSet(const PortSet& ports);

} // namespace eyes::core
