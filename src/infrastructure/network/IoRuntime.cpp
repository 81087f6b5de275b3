#include "infrastructure/network/IoRuntime.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <utility>

namespace eyes::infra {

IoRuntime::IoRuntime(size_t workers)
    : io_(static_cast<int>(workers > 0 ? workers : 1)), workerCount_(workers > 0 ? workers : 1) {}

IoRuntime::~IoRuntime() {
    stop();
}

void IoRuntime::start() {
    if (running_.exchange(true)) {
        return;
    }

    guard_.emplace(asio::make_work_guard(io_));

    threads_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::trace("I/O worker {} running", i);
            io_.run();
            spdlog::trace("I/O worker {} exited", i);
        });
    }

    spdlog::debug("I/O runtime started with {} worker(s)", workerCount_);
}

void IoRuntime::stop() {
    if (!running_.exchange(false)) {
        signals_.reset();
        return;
    }

    guard_.reset();
    asio::post(io_, [this]() {
        if (signals_) {
            asio::error_code ec;
            signals_->cancel(ec);
        }
        io_.stop();
    });

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    signals_.reset();
    io_.restart();
    spdlog::debug("I/O runtime stopped");
}

void IoRuntime::onTerminationSignal(SignalHandler handler) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([handler = std::move(handler)](const asio::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::warn("Received signal {}", signo);
        handler(signo);
    });
}

bool IoRuntime::onWorkerThread() {
    return io_.get_executor().running_in_this_thread();
}

} // namespace eyes::infra
