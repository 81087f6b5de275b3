/**
 * @file IResultReporter.hpp
 * @brief Interface for consumers of the probe outcome stream.
 */

#pragma once

#include "core/services/OutcomeChannel.hpp"
#include "core/types/ProbeOutcome.hpp"
#include "core/types/ScanConfig.hpp"

namespace eyes::core {

/**
 * @brief Consumer of a scan's outcome stream.
 *
 * Implementations render outcomes in arrival order; they must not assume
 * numeric port order.
 */
class IResultReporter {
public:
    virtual ~IResultReporter() = default;

    /**
     * @brief Called once before any outcome is delivered.
     * @param config The configuration of the scan being reported.
     */
    virtual void onStart(const ScanConfig& config) = 0;

    /**
     * @brief Called once per outcome, in stream order.
     * @param outcome The resolved outcome of one port.
     */
    virtual void onOutcome(const ProbeOutcome& outcome) = 0;

    /**
     * @brief Called once after the stream is exhausted.
     * @param summary The completion signal carried by the channel.
     */
    virtual void onFinished(const ScanSummary& summary) = 0;

    /**
     * @brief Drains the channel into this reporter until the stream ends.
     * @param channel The stream to consume.
     * @return Number of outcomes delivered to onOutcome().
     */
    size_t consume(OutcomeChannel& channel) {
        size_t delivered = 0;
        while (auto outcome = channel.receive()) {
            onOutcome(*outcome);
            ++delivered;
        }
        onFinished(channel.summary());
        return delivered;
    }
};

} // namespace eyes::core
