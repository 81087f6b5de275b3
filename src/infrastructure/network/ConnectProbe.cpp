#include "infrastructure/network/ConnectProbe.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace eyes::infra {

ConnectProbe::ConnectProbe(const asio::any_io_executor& executor,
                           asio::ip::tcp::endpoint endpoint, std::chrono::milliseconds timeout)
    : socket_(executor), timer_(executor), endpoint_(std::move(endpoint)), timeout_(timeout) {}

void ConnectProbe::start(CompletionHandler onComplete) {
    onComplete_ = std::move(onComplete);
    startedAt_ = std::chrono::steady_clock::now();

    auto self = shared_from_this();

    asio::error_code ec;
    socket_.open(endpoint_.protocol(), ec);
    if (ec) {
        // Typically EMFILE/ENFILE: report it without re-entering the caller.
        asio::post(socket_.get_executor(), [self, ec]() {
            self->finish(core::ProbeOutcome::error(self->port(), ec.message()));
        });
        return;
    }

    timer_.expires_after(timeout_);
    timer_.async_wait([self](const asio::error_code& waitEc) {
        if (waitEc == asio::error::operation_aborted) {
            return; // Timer cancelled, connect finished first
        }
        self->finish(core::ProbeOutcome::timedOut(self->port()));
    });

    socket_.async_connect(endpoint_,
                          [self](const asio::error_code& connectEc) { self->onConnect(connectEc); });
}

void ConnectProbe::onConnect(const asio::error_code& ec) {
    if (completed_.load()) {
        return; // Deadline expired or abandoned, socket already closed
    }

    if (!ec) {
        finish(core::ProbeOutcome::open(port()));
    } else if (ec == asio::error::connection_refused) {
        finish(core::ProbeOutcome::closed(port(), ec.message()));
    } else if (ec == asio::error::timed_out) {
        finish(core::ProbeOutcome::timedOut(port()));
    } else {
        finish(core::ProbeOutcome::error(port(), ec.message()));
    }
}

void ConnectProbe::finish(core::ProbeOutcome outcome) {
    if (completed_.exchange(true)) {
        return;
    }

    timer_.cancel();
    closeSocket();

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt_);

    auto handler = std::move(onComplete_);
    onComplete_ = nullptr;
    if (handler) {
        handler(std::move(outcome));
    }
}

void ConnectProbe::abandon() {
    if (completed_.exchange(true)) {
        return;
    }

    timer_.cancel();
    closeSocket();
    onComplete_ = nullptr;
}

void ConnectProbe::closeSocket() {
    if (!socket_.is_open()) {
        return;
    }

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Closing probe socket for port {} failed: {}", port(), ec.message());
    }
}

} // namespace eyes::infra
