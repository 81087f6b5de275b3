/**
 * @file IPortScanner.hpp
 * @brief Interface for the port scanning service.
 *
 * This file defines the abstract interface for running a TCP connect scan
 * whose outcomes are streamed into an OutcomeChannel.
 */

#pragma once

#include "core/services/OutcomeChannel.hpp"
#include "core/types/ScanConfig.hpp"

#include <memory>

namespace eyes::core {

/**
 * @brief Interface for port scanning service.
 *
 * Produces exactly one outcome per configured port into the channel, in
 * completion order, and closes the channel when the scan ends or is
 * cancelled.
 */
class IPortScanner {
public:
    virtual ~IPortScanner() = default;

    /**
     * @brief Starts an asynchronous port scan.
     * @param config Configuration specifying target, ports and limits.
     * @param channel Stream receiving the outcomes; closed when the scan ends.
     * @return False if a scan is already running (the channel is left untouched).
     */
    virtual bool scanAsync(const ScanConfig& config,
                           std::shared_ptr<OutcomeChannel> channel) = 0;

    /**
     * @brief Cancels the current scan operation.
     *
     * Pending probes are abandoned without producing outcomes.
     */
    virtual void cancel() = 0;

    /**
     * @brief Checks if a scan is currently in progress.
     * @return True if a scan is running.
     */
    virtual bool isScanning() const = 0;
};

} // namespace eyes::core
