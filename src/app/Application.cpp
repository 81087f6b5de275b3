#include "app/Application.hpp"

#include "core/services/OutcomeChannel.hpp"
#include "core/types/PortSpec.hpp"
#include "infrastructure/network/ConcurrencyLimiter.hpp"
#include "infrastructure/network/ScanScheduler.hpp"
#include "infrastructure/output/JsonReporter.hpp"
#include "infrastructure/output/TextReporter.hpp"
#include "infrastructure/system/DescriptorBudget.hpp"

#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace eyes::app {

Application::Application(int argc, char** argv, std::ostream& out)
    : programName_(argc > 0 ? argv[0] : "eyes"),
      args_(argc > 1 ? std::vector<std::string>(argv + 1, argv + argc)
                     : std::vector<std::string>{}),
      out_(out) {}

Application::Application(std::string programName, std::vector<std::string> args,
                         std::ostream& out)
    : programName_(std::move(programName)), args_(std::move(args)), out_(out) {}

int Application::run() {
    if (args_.empty()) {
        out_ << commandLine_.usage(programName_);
        return ExitUsage;
    }

    CliOptions options;
    try {
        options = commandLine_.parse(args_);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << commandLine_.usage(programName_);
        return ExitUsage;
    }

    if (options.showHelp) {
        out_ << commandLine_.usage(programName_);
        return ExitSuccess;
    }

    initializeLogging(options);

    core::ScanConfig config;
    try {
        config = CommandLine::toScanConfig(options);
    } catch (const core::ParseError& e) {
        spdlog::error("Rejected port specification '{}': {}", options.ports, e.what());
        std::cerr << "error: " << e.what() << '\n';
        return ExitUsage;
    } catch (const core::ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        std::cerr << "error: " << e.what() << '\n';
        return ExitUsage;
    }

    return runScan(std::move(config));
}

void Application::initializeLogging(const CliOptions& options) {
    auto level = spdlog::level::from_str(options.logLevel);

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!options.logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.logFile, 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "warning: cannot open log file " << options.logFile << ": " << e.what()
                      << '\n';
        }
    }

    auto logger = std::make_shared<spdlog::logger>("eyes", sinks.begin(), sinks.end());
    logger->set_level(sinks.size() > 1 ? spdlog::level::debug : level);
    spdlog::set_default_logger(logger);

    spdlog::debug("eyes starting with arguments: {}", fmt::join(args_, " "));
}

int Application::runScan(core::ScanConfig config) {
    auto budget = infra::DescriptorBudget::probe();
    config.concurrency =
        static_cast<int>(budget.clampConcurrency(static_cast<size_t>(config.concurrency)));

    spdlog::debug("Scanning {} ports: {}", config.ports.size(), core::formatPortSet(config.ports));

    infra::IoRuntime runtime(1);
    auto limiter = std::make_shared<infra::ConcurrencyLimiter>(
        static_cast<size_t>(config.concurrency));
    auto scheduler = std::make_shared<infra::ScanScheduler>(runtime, limiter);

    runtime.onTerminationSignal([weak = std::weak_ptr<infra::ScanScheduler>(scheduler)](int) {
        if (auto active = weak.lock()) {
            active->cancel();
        }
    });
    runtime.start();

    auto reporter = makeReporter(config, out_);
    reporter->onStart(config);

    auto channel = std::make_shared<core::OutcomeChannel>();
    if (!scheduler->scanAsync(config, channel)) {
        spdlog::error("Scheduler refused to start the scan");
        return ExitUsage;
    }
    reporter->consume(*channel);

    // Joins the worker before the scheduler and signal watch go away.
    runtime.stop();

    auto summary = channel->summary();
    if (summary.cancelled) {
        return ExitInterrupted;
    }
    return ExitSuccess;
}

std::unique_ptr<core::IResultReporter> Application::makeReporter(const core::ScanConfig& config,
                                                                 std::ostream& out) {
    switch (config.format) {
    case core::OutputFormat::Json:
        return std::make_unique<infra::JsonReporter>(out, config.verbose);
    case core::OutputFormat::Text:
        break;
    }
    return std::make_unique<infra::TextReporter>(out, config.verbose);
}

} // namespace eyes::app
