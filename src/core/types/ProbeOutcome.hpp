/**
 * @file ProbeOutcome.hpp
 * @brief Per-port probe outcomes and the scan completion summary.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace eyes::core {

/**
 * @brief Classification of a single connect attempt.
 */
enum class ProbeState : int {
    Open = 0,     ///< Connection established before the deadline
    Closed = 1,   ///< Remote actively refused the connection
    TimedOut = 2, ///< Neither completion nor refusal before the deadline
    Error = 3     ///< Lower-level failure (unreachable, invalid address, ...)
};

/**
 * @brief Result of probing a single port.
 *
 * Produced exactly once per port and handed over by value.
 */
struct ProbeOutcome {
    uint16_t port{0};                     ///< Port that was probed
    ProbeState state{ProbeState::Error};  ///< Classification of the attempt
    std::string cause;                    ///< Underlying error text (Error / Closed)
    std::chrono::milliseconds elapsed{0}; ///< Time from connect start to resolution

    /**
     * @brief Converts this outcome's state to a human-readable string.
     * @return "open", "closed", "timed out" or "error".
     */
    [[nodiscard]] std::string stateToString() const;

    static std::string probeStateToString(ProbeState state);

    /**
     * @brief Machine-readable state key used by the JSON output.
     * @return "open", "closed", "timed_out" or "error".
     */
    static std::string probeStateKey(ProbeState state);

    static ProbeOutcome open(uint16_t port);
    static ProbeOutcome closed(uint16_t port, std::string cause = {});
    static ProbeOutcome timedOut(uint16_t port);
    static ProbeOutcome error(uint16_t port, std::string cause);

    bool operator==(const ProbeOutcome& other) const = default;
};

/**
 * @brief Terminal signal of an outcome stream.
 */
struct ScanSummary {
    size_t totalPorts{0};  ///< Ports in the scanned set
    size_t open{0};
    size_t closed{0};
    size_t timedOut{0};
    size_t errors{0};
    bool cancelled{false}; ///< Scan was aborted before all ports resolved
    std::chrono::milliseconds duration{0};

    /**
     * @brief Number of outcomes that were produced.
     */
    [[nodiscard]] size_t reported() const { return open + closed + timedOut + errors; }

    /**
     * @brief Adds one outcome to the per-state counters.
     */
    void record(const ProbeOutcome& outcome);

    bool operator==(const ScanSummary& other) const = default;
};

} // namespace eyes::core
