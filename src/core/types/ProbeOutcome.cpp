#include "core/types/ProbeOutcome.hpp"

#include <utility>

namespace eyes::core {

std::string ProbeOutcome::stateToString() const {
    return probeStateToString(state);
}

std::string ProbeOutcome::probeStateToString(ProbeState state) {
    switch (state) {
    case ProbeState::Open:
        return "open";
    case ProbeState::Closed:
        return "closed";
    case ProbeState::TimedOut:
        return "timed out";
    case ProbeState::Error:
        return "error";
    }
    return "error";
}

std::string ProbeOutcome::probeStateKey(ProbeState state) {
    switch (state) {
    case ProbeState::Open:
        return "open";
    case ProbeState::Closed:
        return "closed";
    case ProbeState::TimedOut:
        return "timed_out";
    case ProbeState::Error:
        return "error";
    }
    return "error";
}

ProbeOutcome ProbeOutcome::open(uint16_t port) {
    ProbeOutcome outcome;
    outcome.port = port;
    outcome.state = ProbeState::Open;
    return outcome;
}

ProbeOutcome ProbeOutcome::closed(uint16_t port, std::string cause) {
    ProbeOutcome outcome;
    outcome.port = port;
    outcome.state = ProbeState::Closed;
    outcome.cause = std::move(cause);
    return outcome;
}

ProbeOutcome ProbeOutcome::timedOut(uint16_t port) {
    ProbeOutcome outcome;
    outcome.port = port;
    outcome.state = ProbeState::TimedOut;
    return outcome;
}

ProbeOutcome ProbeOutcome::error(uint16_t port, std::string cause) {
    ProbeOutcome outcome;
    outcome.port = port;
    outcome.state = ProbeState::Error;
    outcome.cause = std::move(cause);
    return outcome;
}

void ScanSummary::record(const ProbeOutcome& outcome) {
    switch (outcome.state) {
    case ProbeState::Open:
        ++open;
        break;
    case ProbeState::Closed:
        ++closed;
        break;
    case ProbeState::TimedOut:
        ++timedOut;
        break;
    case ProbeState::Error:
        ++errors;
        break;
    }
}

} // namespace eyes::core
