#include "infrastructure/system/DescriptorBudget.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#ifdef __unix__
#include <sys/resource.h>
#endif

namespace eyes::infra {

DescriptorBudget DescriptorBudget::probe() {
#ifdef __unix__
    struct rlimit rl {};
    if (getrlimit(RLIMIT_NOFILE, &rl) != 0) {
        spdlog::warn("getrlimit(RLIMIT_NOFILE) failed: {}", std::strerror(errno));
        return DescriptorBudget(std::numeric_limits<size_t>::max());
    }

    if (rl.rlim_cur < rl.rlim_max) {
        struct rlimit raised = rl;
        raised.rlim_cur = rl.rlim_max;
        if (setrlimit(RLIMIT_NOFILE, &raised) == 0) {
            spdlog::debug("Raised descriptor limit from {} to {}", rl.rlim_cur, raised.rlim_cur);
            rl = raised;
        } else {
            spdlog::debug("Could not raise descriptor limit from {} to {}: {}", rl.rlim_cur,
                          rl.rlim_max, std::strerror(errno));
        }
    }

    if (rl.rlim_cur == RLIM_INFINITY) {
        return DescriptorBudget(std::numeric_limits<size_t>::max());
    }
    return DescriptorBudget(static_cast<size_t>(rl.rlim_cur));
#else
    return DescriptorBudget(std::numeric_limits<size_t>::max());
#endif
}

size_t DescriptorBudget::usable() const {
    return softLimit_ > ReservedDescriptors ? softLimit_ - ReservedDescriptors : 0;
}

size_t DescriptorBudget::clampConcurrency(size_t requested) const {
    size_t limit = std::max<size_t>(usable(), 1);
    if (requested <= limit) {
        return requested;
    }

    spdlog::warn("Concurrency {} exceeds the descriptor limit ({}), capping to {}", requested,
                 softLimit_, limit);
    return limit;
}

} // namespace eyes::infra
