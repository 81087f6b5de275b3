#include "infrastructure/network/ScanScheduler.hpp"

#include "infrastructure/network/ConnectProbe.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eyes::infra {

namespace {

// Delay before re-checking admission when a shared limiter is full and this
// session has nothing in flight that would free a slot.
constexpr std::chrono::milliseconds AdmissionRetryDelay{5};

std::string stripBrackets(const std::string& address) {
    if (address.size() > 2 && address.front() == '[' && address.back() == ']') {
        return address.substr(1, address.size() - 2);
    }
    return address;
}

} // namespace

/**
 * @brief Runtime state of one scan: pending ports, in-flight probes and the
 *        outcome stream. Only touched from its strand.
 */
class ScanSession : public std::enable_shared_from_this<ScanSession> {
public:
    ScanSession(asio::io_context& io, core::ScanConfig config,
                std::shared_ptr<ConcurrencyLimiter> limiter,
                std::shared_ptr<core::OutcomeChannel> channel, std::function<void()> onClosed)
        : strand_(asio::make_strand(io)), resolver_(strand_), retryTimer_(strand_),
          config_(std::move(config)), ports_(config_.ports.begin(), config_.ports.end()),
          limiter_(std::move(limiter)), channel_(std::move(channel)),
          onClosed_(std::move(onClosed)) {}

    void start() {
        asio::post(strand_, [self = shared_from_this()]() { self->resolve(); });
    }

    void cancel() {
        asio::post(strand_, [self = shared_from_this()]() { self->abort(); });
    }

private:
    void resolve() {
        startedAt_ = std::chrono::steady_clock::now();
        spdlog::info("Starting port scan of {} on {} ports (concurrency {}, timeout {}s)",
                     config_.targetAddress, ports_.size(), limiter_->capacity(),
                     config_.timeout.count());

        auto host = stripBrackets(config_.targetAddress);

        asio::error_code ec;
        auto address = asio::ip::make_address(host, ec);
        if (!ec) {
            address_ = address;
            fill();
            return;
        }

        resolver_.async_resolve(
            host, "0", asio::ip::tcp::resolver::numeric_service,
            [self = shared_from_this()](const asio::error_code& resolveEc,
                                        asio::ip::tcp::resolver::results_type results) {
                self->onResolved(resolveEc, std::move(results));
            });
    }

    void onResolved(const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
        if (done_) {
            return;
        }

        if (ec || results.empty()) {
            auto reason = ec ? ec.message() : std::string("no addresses found");
            spdlog::warn("Could not resolve {}: {}", config_.targetAddress, reason);
            failAll("cannot resolve " + config_.targetAddress + ": " + reason);
            return;
        }

        address_ = results.begin()->endpoint().address();
        spdlog::debug("Resolved {} to {}", config_.targetAddress, address_.to_string());
        fill();
    }

    // Keeps the pool at capacity while unscanned ports remain.
    void fill() {
        while (!done_ && next_ < ports_.size()) {
            if (!limiter_->tryAcquire()) {
                break;
            }

            uint16_t port = ports_[next_++];
            auto probe = std::make_shared<ConnectProbe>(
                strand_, asio::ip::tcp::endpoint(address_, port),
                std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout));
            inFlight_.emplace(port, probe);

            probe->start([self = shared_from_this(), port](core::ProbeOutcome outcome) {
                self->onProbeComplete(port, std::move(outcome));
            });
        }

        if (!done_ && inFlight_.empty() && next_ < ports_.size()) {
            retryTimer_.expires_after(AdmissionRetryDelay);
            retryTimer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
                if (!ec) {
                    self->fill();
                }
            });
        }
    }

    void onProbeComplete(uint16_t port, core::ProbeOutcome outcome) {
        if (inFlight_.erase(port) == 0 || done_) {
            return;
        }
        limiter_->release();

        spdlog::debug("Port {} resolved as {} after {}ms", port, outcome.stateToString(),
                      outcome.elapsed.count());

        summary_.record(outcome);
        channel_->push(std::move(outcome));

        if (summary_.reported() == ports_.size()) {
            finish(false);
        } else {
            fill();
        }
    }

    // Every port gets an Error outcome when the target cannot be resolved.
    void failAll(const std::string& cause) {
        for (size_t i = next_; i < ports_.size(); ++i) {
            auto outcome = core::ProbeOutcome::error(ports_[i], cause);
            summary_.record(outcome);
            channel_->push(std::move(outcome));
        }
        next_ = ports_.size();
        finish(false);
    }

    void abort() {
        if (done_) {
            return;
        }

        spdlog::info("Cancelling port scan of {} ({} probes in flight)", config_.targetAddress,
                     inFlight_.size());

        resolver_.cancel();
        retryTimer_.cancel();
        for (auto& [port, probe] : inFlight_) {
            probe->abandon();
            limiter_->release();
        }
        inFlight_.clear();

        finish(true);
    }

    void finish(bool cancelled) {
        done_ = true;
        summary_.totalPorts = ports_.size();
        summary_.cancelled = cancelled;
        summary_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt_);

        spdlog::info("Port scan of {} {}: {} open ports found", config_.targetAddress,
                     cancelled ? "cancelled" : "complete", summary_.open);

        // Clear the scanning flag first so a reader woken by close() can start the next scan.
        if (onClosed_) {
            onClosed_();
        }
        channel_->close(summary_);
    }

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::resolver resolver_;
    asio::steady_timer retryTimer_;
    const core::ScanConfig config_;
    const std::vector<uint16_t> ports_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;
    std::shared_ptr<core::OutcomeChannel> channel_;
    std::function<void()> onClosed_;

    asio::ip::address address_;
    size_t next_{0};
    std::unordered_map<uint16_t, std::shared_ptr<ConnectProbe>> inFlight_;
    core::ScanSummary summary_;
    std::chrono::steady_clock::time_point startedAt_{std::chrono::steady_clock::now()};
    bool done_{false};
};

ScanScheduler::ScanScheduler(IoRuntime& runtime, std::shared_ptr<ConcurrencyLimiter> limiter)
    : runtime_(runtime), limiter_(std::move(limiter)),
      scanning_(std::make_shared<std::atomic<bool>>(false)) {}

ScanScheduler::~ScanScheduler() {
    std::shared_ptr<core::OutcomeChannel> channel;
    {
        std::lock_guard lock(mutex_);
        channel = channel_;
    }

    cancel();

    if (channel && runtime_.isRunning() && !runtime_.onWorkerThread()) {
        channel->waitClosed();
    }
}

bool ScanScheduler::scanAsync(const core::ScanConfig& config,
                              std::shared_ptr<core::OutcomeChannel> channel) {
    config.validate();

    std::lock_guard lock(mutex_);
    if (scanning_->exchange(true)) {
        spdlog::warn("Scan already in progress");
        return false;
    }

    auto limiter = limiter_ ? limiter_
                            : std::make_shared<ConcurrencyLimiter>(
                                  static_cast<size_t>(config.concurrency));

    channel_ = channel;
    session_ = std::make_shared<ScanSession>(runtime_.context(), config, std::move(limiter),
                                             std::move(channel),
                                             [scanning = scanning_]() { *scanning = false; });
    session_->start();
    return true;
}

void ScanScheduler::cancel() {
    std::lock_guard lock(mutex_);
    if (session_ && scanning_->load()) {
        session_->cancel();
    }
}

bool ScanScheduler::isScanning() const {
    return scanning_->load();
}

} // namespace eyes::infra
