#include "infrastructure/network/ConcurrencyLimiter.hpp"

#include <spdlog/spdlog.h>

namespace eyes::infra {

ConcurrencyLimiter::ConcurrencyLimiter(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

bool ConcurrencyLimiter::tryAcquire() {
    size_t current = inFlight_.load();
    do {
        if (current >= capacity_) {
            return false;
        }
    } while (!inFlight_.compare_exchange_weak(current, current + 1));

    size_t held = current + 1;
    size_t peak = peak_.load();
    while (held > peak && !peak_.compare_exchange_weak(peak, held)) {
    }

    ++admitted_;
    return true;
}

void ConcurrencyLimiter::release() {
    size_t current = inFlight_.load();
    do {
        if (current == 0) {
            spdlog::warn("ConcurrencyLimiter released more slots than acquired");
            return;
        }
    } while (!inFlight_.compare_exchange_weak(current, current - 1));
}

} // namespace eyes::infra
