#include "infrastructure/output/JsonReporter.hpp"

namespace eyes::infra {

JsonReporter::JsonReporter(std::ostream& out, bool verbose) : out_(out), verbose_(verbose) {}

void JsonReporter::onStart(const core::ScanConfig& config) {
    if (!verbose_) {
        return;
    }

    nlohmann::json j;
    j["event"] = "started";
    j["target"] = config.targetAddress;
    j["ports"] = config.ports.size();
    j["concurrency"] = config.concurrency;
    j["timeout_s"] = config.timeout.count();
    writeLine(j);
}

void JsonReporter::onOutcome(const core::ProbeOutcome& outcome) {
    bool printable = verbose_ || outcome.state == core::ProbeState::Open ||
                     outcome.state == core::ProbeState::Error;
    if (printable) {
        writeLine(toJson(outcome));
    }
}

void JsonReporter::onFinished(const core::ScanSummary& summary) {
    writeLine(toJson(summary));
}

nlohmann::json JsonReporter::toJson(const core::ProbeOutcome& outcome) {
    nlohmann::json j;
    j["port"] = outcome.port;
    j["state"] = core::ProbeOutcome::probeStateKey(outcome.state);
    if (!outcome.cause.empty()) {
        j["cause"] = outcome.cause;
    }
    j["elapsed_ms"] = outcome.elapsed.count();
    return j;
}

nlohmann::json JsonReporter::toJson(const core::ScanSummary& summary) {
    nlohmann::json j;
    j["event"] = "finished";
    j["cancelled"] = summary.cancelled;
    j["open"] = summary.open;
    j["closed"] = summary.closed;
    j["timed_out"] = summary.timedOut;
    j["errors"] = summary.errors;
    j["total"] = summary.totalPorts;
    j["duration_ms"] = summary.duration.count();
    return j;
}

void JsonReporter::writeLine(const nlohmann::json& j) {
    out_ << j.dump() << '\n';
    out_.flush();
}

} // namespace eyes::infra
