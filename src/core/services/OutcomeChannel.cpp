#include "core/services/OutcomeChannel.hpp"

#include <utility>

namespace eyes::core {

bool OutcomeChannel::push(ProbeOutcome outcome) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
    return true;
}

void OutcomeChannel::close(const ScanSummary& summary) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        summary_ = summary;
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<ProbeOutcome> OutcomeChannel::receive() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    auto outcome = std::move(queue_.front());
    queue_.pop_front();
    return outcome;
}

void OutcomeChannel::waitClosed() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_; });
}

bool OutcomeChannel::isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

ScanSummary OutcomeChannel::summary() const {
    std::lock_guard lock(mutex_);
    return summary_;
}

} // namespace eyes::core
