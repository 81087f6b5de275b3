#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace eyes::infra {

/**
 * @brief The event loop every probe of a scan is multiplexed on.
 *
 * Probes wait on socket readiness and timers inside the loop instead of
 * holding a thread each, so one worker is enough for thousands of concurrent
 * connects. A work guard keeps the loop alive between scans until stop().
 *
 * The runtime also owns the SIGINT/SIGTERM watch of the process, because the
 * handler has to run on the same loop as the scan it cancels.
 *
 * @note This class is non-copyable.
 */
class IoRuntime {
public:
    using SignalHandler = std::function<void(int)>;

    /**
     * @param workers Number of threads running the loop (at least one).
     */
    explicit IoRuntime(size_t workers = 1);

    ~IoRuntime();

    IoRuntime(const IoRuntime&) = delete;
    IoRuntime& operator=(const IoRuntime&) = delete;

    /**
     * @brief Spawns the worker threads. No effect if already running.
     */
    void start();

    /**
     * @brief Stops the loop, drops pending handlers and joins the workers.
     *
     * The runtime can be started again afterwards.
     */
    void stop();

    /**
     * @brief Invokes `handler` with the signal number on the first SIGINT or SIGTERM.
     *
     * Call before start(). A later call replaces the previous handler.
     */
    void onTerminationSignal(SignalHandler handler);

    asio::io_context& context() { return io_; }

    bool isRunning() const { return running_.load(); }

    /**
     * @brief True when called from one of this runtime's worker threads.
     */
    bool onWorkerThread();

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context io_;
    std::optional<WorkGuard> guard_;
    std::unique_ptr<asio::signal_set> signals_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t workerCount_;
};

} // namespace eyes::infra
