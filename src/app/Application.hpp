#pragma once

#include "app/CommandLine.hpp"
#include "core/services/IResultReporter.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace eyes::app {

/**
 * @brief Process exit codes.
 */
enum ExitCode : int {
    ExitSuccess = 0,     ///< Scan finished (whatever the port states)
    ExitUsage = 1,       ///< Bad arguments or port specification, nothing scanned
    ExitInterrupted = 130 ///< Scan cancelled by SIGINT/SIGTERM
};

/**
 * @brief Wires the command line, logging, I/O context, scheduler and
 *        reporter together for one scan.
 */
class Application {
public:
    /**
     * @brief Constructs the application from process arguments.
     * @param argc Argument count, including the program name.
     * @param argv Argument vector.
     * @param out Stream receiving the scan results.
     */
    Application(int argc, char** argv, std::ostream& out = std::cout);

    /**
     * @brief Constructs the application from already split arguments.
     */
    Application(std::string programName, std::vector<std::string> args,
                std::ostream& out = std::cout);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Parses arguments, runs the scan and reports it.
     * @return Process exit code (see ExitCode).
     */
    int run();

    /**
     * @brief Creates the reporter matching the configured output format.
     */
    static std::unique_ptr<core::IResultReporter> makeReporter(const core::ScanConfig& config,
                                                               std::ostream& out);

private:
    void initializeLogging(const CliOptions& options);
    int runScan(core::ScanConfig config);

    std::string programName_;
    std::vector<std::string> args_;
    std::ostream& out_;
    CommandLine commandLine_;
};

} // namespace eyes::app
