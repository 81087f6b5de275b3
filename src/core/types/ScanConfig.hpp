/**
 * @file ScanConfig.hpp
 * @brief Configuration of a single scan.
 */

#pragma once

#include "core/types/PortSpec.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace eyes::core {

/**
 * @brief Output rendering of the outcome stream.
 */
enum class OutputFormat {
    Text, ///< "<port>: open" lines and a completion marker
    Json  ///< One JSON object per line
};

/**
 * @brief Raised when a scan configuration is not usable.
 */
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Configuration for a scan operation.
 *
 * Built once from validated input and copied by the scheduler, which never
 * mutates its copy.
 */
struct ScanConfig {
    std::string targetAddress;          ///< IPv4/IPv6 literal or host name
    PortSet ports;                      ///< Ports to probe
    int concurrency{1000};              ///< Maximum probes awaiting resolution
    std::chrono::seconds timeout{3};    ///< Per-probe connect deadline
    bool verbose{false};                ///< Report every outcome, not only open ports
    OutputFormat format{OutputFormat::Text};

    /**
     * @brief Checks the configuration invariants.
     * @throws ConfigError naming the first violated constraint.
     */
    void validate() const;

    /**
     * @brief Parses "text" or "json".
     * @throws ConfigError for any other value.
     */
    static OutputFormat formatFromString(const std::string& str);
};

} // namespace eyes::core
