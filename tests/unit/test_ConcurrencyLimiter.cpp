#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ConcurrencyLimiter.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace eyes::infra;

TEST_CASE("ConcurrencyLimiter admission", "[ConcurrencyLimiter]") {
    ConcurrencyLimiter limiter(3);

    SECTION("Admits up to capacity") {
        REQUIRE(limiter.capacity() == 3);
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.tryAcquire());
        REQUIRE_FALSE(limiter.tryAcquire());
        REQUIRE(limiter.inFlight() == 3);
        REQUIRE(limiter.peakInFlight() == 3);
    }

    SECTION("Release frees a slot") {
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.tryAcquire());
        limiter.release();
        REQUIRE(limiter.inFlight() == 2);
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.admitted() == 4);
        REQUIRE(limiter.peakInFlight() == 3);
    }

    SECTION("Release without acquire is ignored") {
        limiter.release();
        REQUIRE(limiter.inFlight() == 0);
        REQUIRE(limiter.tryAcquire());
        REQUIRE(limiter.inFlight() == 1);
    }
}

TEST_CASE("ConcurrencyLimiter clamps capacity", "[ConcurrencyLimiter]") {
    ConcurrencyLimiter limiter(0);
    REQUIRE(limiter.capacity() == 1);
    REQUIRE(limiter.tryAcquire());
    REQUIRE_FALSE(limiter.tryAcquire());
}

TEST_CASE("ConcurrencyLimiter never exceeds capacity across threads", "[ConcurrencyLimiter]") {
    constexpr size_t Capacity = 4;
    ConcurrencyLimiter limiter(Capacity);
    std::atomic<size_t> holders{0};
    std::atomic<bool> exceeded{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 2000; ++i) {
                if (!limiter.tryAcquire()) {
                    continue;
                }
                if (++holders > Capacity) {
                    exceeded = true;
                }
                --holders;
                limiter.release();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE_FALSE(exceeded);
    REQUIRE(limiter.inFlight() == 0);
    REQUIRE(limiter.peakInFlight() <= Capacity);
}
