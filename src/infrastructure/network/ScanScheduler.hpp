#pragma once

#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/IoRuntime.hpp"
#include "infrastructure/network/ConcurrencyLimiter.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace eyes::infra {

class ScanSession;

/**
 * @brief Asynchronous TCP connect scanner.
 *
 * Fans the configured port set out to ConnectProbes while keeping at most
 * `capacity` probes unresolved, and pushes each outcome into the channel as
 * soon as it resolves. All session state is confined to one strand of the
 * IoRuntime. Implements the core::IPortScanner interface.
 */
class ScanScheduler : public core::IPortScanner {
public:
    /**
     * @brief Constructs a ScanScheduler on the given runtime.
     * @param runtime Event loop the probes run on.
     * @param limiter Admission limiter shared by the probes of each scan. When
     *        null, every scan gets its own limiter sized from its config.
     */
    explicit ScanScheduler(IoRuntime& runtime,
                           std::shared_ptr<ConcurrencyLimiter> limiter = nullptr);

    /**
     * @brief Destructor. Cancels any active scan and, when the runtime is
     *        running on other threads, waits until its sockets are released.
     */
    ~ScanScheduler() override;

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    /**
     * @brief Starts an asynchronous scan.
     * @param config Scan configuration (target, ports, timeout, concurrency).
     * @param channel Receives one outcome per port, then the completion signal.
     * @return False if a scan is already in progress.
     * @throws core::ConfigError if the configuration is invalid.
     */
    bool scanAsync(const core::ScanConfig& config,
                   std::shared_ptr<core::OutcomeChannel> channel) override;

    /**
     * @brief Cancels the currently running scan.
     *
     * Every in-flight probe is abandoned and its socket closed; no further
     * outcomes are produced and the channel is closed as cancelled.
     */
    void cancel() override;

    /**
     * @brief Checks if a scan is currently in progress.
     * @return True from scanAsync() until the channel is closed.
     */
    bool isScanning() const override;

private:
    IoRuntime& runtime_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;
    std::shared_ptr<std::atomic<bool>> scanning_;
    std::shared_ptr<ScanSession> session_;
    std::shared_ptr<core::OutcomeChannel> channel_;
    mutable std::mutex mutex_;
};

} // namespace eyes::infra
