#pragma once

#include "core/types/ProbeOutcome.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace eyes::infra {

/**
 * @brief One nonblocking TCP connect attempt bounded by a deadline.
 *
 * Races an async_connect against a steady_timer on the given executor. The
 * first of the two to finish classifies the attempt and closes the socket;
 * the other one is cancelled. Exactly one attempt is made per probe.
 *
 * The socket lives inside the probe, so it is released on every exit path,
 * including abandon() and destruction of a probe that never resolved.
 */
class ConnectProbe : public std::enable_shared_from_this<ConnectProbe> {
public:
    using CompletionHandler = std::function<void(core::ProbeOutcome)>;

    /**
     * @brief Constructs a probe. Nothing happens until start() is called.
     * @param executor Executor (usually a strand) all handlers run on.
     * @param endpoint Target address and port.
     * @param timeout Connect deadline.
     */
    ConnectProbe(const asio::any_io_executor& executor, asio::ip::tcp::endpoint endpoint,
                 std::chrono::milliseconds timeout);

    ConnectProbe(const ConnectProbe&) = delete;
    ConnectProbe& operator=(const ConnectProbe&) = delete;

    /**
     * @brief Starts the connect attempt and its deadline.
     *
     * The handler is always invoked asynchronously on the probe's executor,
     * exactly once, unless the probe is abandoned first. The probe must be
     * owned by a std::shared_ptr.
     *
     * @param onComplete Receives the outcome of the attempt.
     */
    void start(CompletionHandler onComplete);

    /**
     * @brief Gives up on the attempt without reporting an outcome.
     *
     * Cancels the deadline and closes the socket. Must be called from the
     * probe's executor. Has no effect once the probe has resolved.
     */
    void abandon();

    /**
     * @brief True once an outcome was produced or the probe was abandoned.
     */
    bool isResolved() const { return completed_.load(); }

    uint16_t port() const { return endpoint_.port(); }

private:
    void onConnect(const asio::error_code& ec);
    void finish(core::ProbeOutcome outcome);
    void closeSocket();

    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::ip::tcp::endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point startedAt_;
    CompletionHandler onComplete_;
    std::atomic<bool> completed_{false};
};

} // namespace eyes::infra
