/**
 * @file OutcomeChannel.hpp
 * @brief Queue carrying probe outcomes from the scheduler to a reporter.
 */

#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace eyes::core {

/**
 * @brief Thread-safe outcome queue with a terminal completion signal.
 *
 * Producers push outcomes in completion order; a single consumer receives
 * them in the same order. close() ends the stream: the consumer drains what
 * is left and then sees std::nullopt.
 *
 * @note This class is non-copyable.
 */
class OutcomeChannel {
public:
    OutcomeChannel() = default;

    OutcomeChannel(const OutcomeChannel&) = delete;
    OutcomeChannel& operator=(const OutcomeChannel&) = delete;

    /**
     * @brief Appends an outcome to the stream.
     * @param outcome The outcome to deliver.
     * @return False if the channel was already closed (the outcome is dropped).
     */
    bool push(ProbeOutcome outcome);

    /**
     * @brief Ends the stream. Only the first call has an effect.
     * @param summary Completion signal handed to the consumer.
     */
    void close(const ScanSummary& summary);

    /**
     * @brief Blocks until an outcome is available or the stream has ended.
     * @return The next outcome, or std::nullopt once closed and drained.
     */
    std::optional<ProbeOutcome> receive();

    /**
     * @brief Blocks until the channel is closed.
     */
    void waitClosed();

    bool isClosed() const;

    /**
     * @brief Completion signal passed to close(), default-constructed before.
     */
    ScanSummary summary() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProbeOutcome> queue_;
    ScanSummary summary_;
    bool closed_{false};
};

} // namespace eyes::core
