#pragma once

#include <atomic>
#include <cstddef>

namespace eyes::infra {

/**
 * @brief Bounded admission for in-flight probes of one scan session.
 *
 * A slot must be acquired before a probe starts and released once it has
 * resolved or been abandoned. Admission never blocks: a full limiter simply
 * refuses, and the scheduler retries when a running probe releases its slot.
 * Counters are atomic so admission stays correct when probe completions run
 * on several I/O threads.
 */
class ConcurrencyLimiter {
public:
    /**
     * @brief Constructs a limiter.
     * @param capacity Maximum number of slots held at once (clamped to >= 1).
     */
    explicit ConcurrencyLimiter(size_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @brief Takes a slot if one is free.
     * @return True if a slot was acquired.
     */
    [[nodiscard]] bool tryAcquire();

    /**
     * @brief Returns a slot taken by tryAcquire().
     */
    void release();

    size_t capacity() const { return capacity_; }
    size_t inFlight() const { return inFlight_.load(); }

    /**
     * @brief Highest number of slots held at once since construction.
     */
    size_t peakInFlight() const { return peak_.load(); }

    /**
     * @brief Total number of successful acquisitions.
     */
    size_t admitted() const { return admitted_.load(); }

private:
    const size_t capacity_;
    std::atomic<size_t> inFlight_{0};
    std::atomic<size_t> peak_{0};
    std::atomic<size_t> admitted_{0};
};

} // namespace eyes::infra
