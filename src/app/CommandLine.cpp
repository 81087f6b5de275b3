#include "app/CommandLine.hpp"

#include "core/types/PortSpec.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace po = boost::program_options;

namespace eyes::app {

namespace {

constexpr std::array<const char*, 7> LogLevels = {"trace", "debug", "info",    "warn",
                                                  "error", "critical", "off"};

} // namespace

CommandLine::CommandLine() : visible_("Options"), all_("All options") {
    // clang-format off
    visible_.add_options()
        ("help,h", "Show this help message")
        ("verbose,v", po::bool_switch(), "Display detailed information")
        ("ports,p", po::value<std::string>()->default_value("1-1024"),
            "List of ports to scan (e.g. 22,80,8000-8100)")
        ("concurrency,c", po::value<int>()->default_value(1000),
            "Number of simultaneous connection attempts")
        ("timeout,t", po::value<int>()->default_value(3), "Connection timeout in seconds")
        ("format,f", po::value<std::string>()->default_value("text"), "Output format: text or json")
        ("log-level", po::value<std::string>()->default_value("warn"),
            "Diagnostic log level: trace, debug, info, warn, error, critical, off")
        ("log-file", po::value<std::string>(), "Write diagnostics to a rotating log file");
    // clang-format on

    all_.add(visible_);
    all_.add_options()("target", po::value<std::string>(), "The IP or host name to scan");
    positional_.add("target", 1);
}

CliOptions CommandLine::parse(const std::vector<std::string>& args) const {
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(all_).positional(positional_).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    CliOptions options;
    options.showHelp = vm.count("help") > 0;
    if (options.showHelp) {
        return options;
    }

    if (!vm.count("target")) {
        throw UsageError("the target address is required");
    }

    options.target = vm["target"].as<std::string>();
    options.verbose = vm["verbose"].as<bool>();
    options.ports = vm["ports"].as<std::string>();
    options.concurrency = vm["concurrency"].as<int>();
    options.timeoutSeconds = vm["timeout"].as<int>();
    options.format = vm["format"].as<std::string>();
    options.logLevel = vm["log-level"].as<std::string>();
    if (vm.count("log-file")) {
        options.logFile = vm["log-file"].as<std::string>();
    }

    if (std::find(LogLevels.begin(), LogLevels.end(), options.logLevel) == LogLevels.end()) {
        throw UsageError("unknown log level '" + options.logLevel + "'");
    }

    return options;
}

std::string CommandLine::usage(const std::string& programName) const {
    std::ostringstream out;
    out << "Usage: " << programName << " [options] <target>\n\n"
        << "Examples:\n"
        << "  " << programName << " 127.0.0.1\n"
        << "  " << programName << " -p 22,80,8000-8100 -c 200 -t 1 -v scanme.example.org\n\n"
        << visible_;
    return out.str();
}

core::ScanConfig CommandLine::toScanConfig(const CliOptions& options) {
    core::ScanConfig config;
    config.targetAddress = options.target;
    config.ports = core::parsePortSpec(options.ports);
    config.concurrency = options.concurrency;
    config.timeout = std::chrono::seconds(options.timeoutSeconds);
    config.verbose = options.verbose;
    config.format = core::ScanConfig::formatFromString(options.format);
    config.validate();
    return config;
}

} // namespace eyes::app
