#pragma once

#include "core/types/ScanConfig.hpp"

#include <boost/program_options.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace eyes::app {

/**
 * @brief Raised for malformed or missing command-line arguments.
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raw command-line values, before port parsing and validation.
 */
struct CliOptions {
    std::string target;                ///< Positional target address
    std::string ports{"1-1024"};       ///< Port specification
    int concurrency{1000};             ///< Simultaneous probes
    int timeoutSeconds{3};             ///< Connect timeout per port
    bool verbose{false};               ///< Print every outcome
    std::string format{"text"};        ///< "text" or "json"
    std::string logLevel{"warn"};      ///< Diagnostic log level
    std::string logFile;               ///< Optional rotating log file
    bool showHelp{false};              ///< -h / --help was given
};

/**
 * @brief Command-line front end of the scanner.
 */
class CommandLine {
public:
    CommandLine();

    /**
     * @brief Parses argv.
     * @param args Arguments without the program name.
     * @return The parsed options.
     * @throws UsageError for unknown options, bad values or a missing target.
     */
    CliOptions parse(const std::vector<std::string>& args) const;

    /**
     * @brief Builds the usage text.
     * @param programName Name shown in the usage line.
     */
    std::string usage(const std::string& programName) const;

    /**
     * @brief Turns parsed options into a validated scan configuration.
     * @throws core::ParseError if the port specification is malformed.
     * @throws core::ConfigError if any other value is out of range.
     */
    static core::ScanConfig toScanConfig(const CliOptions& options);

private:
    boost::program_options::options_description visible_;
    boost::program_options::options_description all_;
    boost::program_options::positional_options_description positional_;
};

} // namespace eyes::app
