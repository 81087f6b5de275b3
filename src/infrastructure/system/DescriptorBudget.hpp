#pragma once

#include <cstddef>

namespace eyes::infra {

/**
 * @brief File-descriptor limits of the current process.
 *
 * Every in-flight probe holds one socket, so the usable descriptor count is
 * an upper bound for scan concurrency.
 */
class DescriptorBudget {
public:
    /// Descriptors kept free for stdio, log files, the resolver and epoll.
    static constexpr size_t ReservedDescriptors = 64;

    /**
     * @brief Reads RLIMIT_NOFILE, raising the soft limit to the hard limit
     *        when possible.
     * @return The budget for this process.
     */
    static DescriptorBudget probe();

    /**
     * @brief Builds a budget from a known soft limit (used by tests).
     */
    explicit DescriptorBudget(size_t softLimit) : softLimit_(softLimit) {}

    size_t softLimit() const { return softLimit_; }

    /**
     * @brief Descriptors available for probe sockets.
     */
    size_t usable() const;

    /**
     * @brief Caps a requested concurrency to the usable descriptors.
     * @param requested Requested number of concurrent probes.
     * @return The requested value, or the usable count (at least 1) if smaller.
     */
    size_t clampConcurrency(size_t requested) const;

private:
    size_t softLimit_;
};

} // namespace eyes::infra
