// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for logging rate limiter

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace skiff::util;

TEST_CASE("RateLimiter: Burst capacity", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N lines allowed, then limited") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("codec:1", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("codec:1", 200, 3600));
    }

    SECTION("Callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("codec:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("codec:1", 200, 3600));
        REQUIRE(limiter.should_log("codec:2", 200, 3600));
    }

    SECTION("Non-positive parameters never log") {
        REQUIRE_FALSE(limiter.should_log("bad:1", 0, 3600));
        REQUIRE_FALSE(limiter.should_log("bad:2", 10, 0));
        REQUIRE_FALSE(limiter.should_log("bad:3", -1, -1));
    }
}

TEST_CASE("RateLimiter: Token refill over time", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("One token per tenth of the period") {
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));
    }

    SECTION("Bucket caps at capacity") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("cap", 5, 1);
        }

        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("cap", 5, 1));
    }
}

TEST_CASE("RateLimiter: Flood of bad frames from one peer", "[rate_limiter][security]") {
    RateLimiter limiter;

    int logged = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("bad_frame", 200, 3600)) {
            logged++;
        }
    }
    REQUIRE(logged == 200);
}

TEST_CASE("RateLimiter: Thread safety", "[rate_limiter][threading]") {
    RateLimiter limiter;
    const int num_threads = 4;
    const int attempts_per_thread = 100;
    std::atomic<int> logged{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&limiter, &logged]() {
            for (int i = 0; i < attempts_per_thread; ++i) {
                if (limiter.should_log("threads", 200, 3600)) {
                    logged++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(logged == 200);
}
