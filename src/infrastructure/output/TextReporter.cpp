#include "infrastructure/output/TextReporter.hpp"

#include <spdlog/fmt/fmt.h>

namespace eyes::infra {

namespace {

constexpr const char* Tag = "[eyes]";

} // namespace

TextReporter::TextReporter(std::ostream& out, bool verbose) : out_(out), verbose_(verbose) {}

void TextReporter::onStart(const core::ScanConfig& config) {
    if (!verbose_) {
        return;
    }

    out_ << fmt::format("{} Scanning {} ports on {}\n", Tag, config.ports.size(),
                        config.targetAddress);
    out_ << fmt::format("{} Concurrency: {}\n", Tag, config.concurrency);
    out_ << fmt::format("{} Timeout: {}\n", Tag, config.timeout.count());
    out_.flush();
}

void TextReporter::onOutcome(const core::ProbeOutcome& outcome) {
    bool printable = verbose_ || outcome.state == core::ProbeState::Open ||
                     outcome.state == core::ProbeState::Error;
    if (!printable) {
        return;
    }

    out_ << formatOutcome(outcome) << '\n';
    out_.flush();
}

void TextReporter::onFinished(const core::ScanSummary& summary) {
    if (verbose_) {
        out_ << fmt::format("{} {} open, {} closed, {} timed out, {} errors in {:.2f}s\n", Tag,
                            summary.open, summary.closed, summary.timedOut, summary.errors,
                            static_cast<double>(summary.duration.count()) / 1000.0);
    }

    out_ << Tag << (summary.cancelled ? " Scan cancelled" : " Finished scan") << '\n';
    out_.flush();
}

std::string TextReporter::formatOutcome(const core::ProbeOutcome& outcome) {
    if (outcome.state == core::ProbeState::Error) {
        return fmt::format("{}: error ({})", outcome.port, outcome.cause);
    }
    return fmt::format("{}: {}", outcome.port, outcome.stateToString());
}

} // namespace eyes::infra
