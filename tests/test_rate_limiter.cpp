/// @file test_rate_limiter.cpp
/// Unit tests for rate_limiter.hpp: token-bucket admission control.

#include "rate_limiter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace fetch_engine;
using namespace std::chrono_literals;

static RateLimitConfig makeConfig(double rps, int burst) {
    RateLimitConfig cfg;
    cfg.requestsPerSecond = rps;
    cfg.burstSize         = burst;
    return cfg;
}

// ============================================================================
// Construction
// ============================================================================

TEST(RateLimiter, StartsWithFullBucket) {
    RateLimiter rl(makeConfig(5.0, 7));
    EXPECT_DOUBLE_EQ(rl.tokens(), 7.0);
}

// ============================================================================
// Burst behaviour
// ============================================================================

TEST(RateLimiter, BurstOfBGrantedThenWait) {
    const int burst = 5;
    RateLimiter rl(makeConfig(1.0, burst));
    const auto now = RateLimiter::Clock::now();

    for (int i = 0; i < burst; ++i) {
        EXPECT_DOUBLE_EQ(rl.acquire(1, now), 0.0) << "call " << i;
    }
    EXPECT_GT(rl.acquire(1, now), 0.0);
}

TEST(RateLimiter, WaitIsDeficitOverRate) {
    // rate=4/s, burst=2: after two grants the bucket is empty,
    // so one more token takes 1/4 s.
    RateLimiter rl(makeConfig(4.0, 2));
    const auto now = RateLimiter::Clock::now();
    rl.acquire(1, now);
    rl.acquire(1, now);

    EXPECT_NEAR(rl.acquire(1, now), 0.25, 1e-9);
    EXPECT_NEAR(rl.acquire(2, now), 0.5, 1e-9);
}

TEST(RateLimiter, DeniedCallDoesNotSpendTokens) {
    RateLimiter rl(makeConfig(4.0, 1));
    const auto t0 = RateLimiter::Clock::now();
    ASSERT_DOUBLE_EQ(rl.acquire(1, t0), 0.0);

    // 125 ms later only half a token has come back.
    EXPECT_DOUBLE_EQ(rl.acquire(1, t0 + 125ms), 0.125);
    EXPECT_DOUBLE_EQ(rl.tokens(), 0.5);
}

TEST(RateLimiter, ClockAdvancesOnDeniedCalls) {
    RateLimiter rl(makeConfig(4.0, 1));
    const auto t0 = RateLimiter::Clock::now();
    rl.acquire(1, t0);                          // tokens: 0
    EXPECT_GT(rl.acquire(1, t0 + 125ms), 0.0);  // tokens: 0.5, clock -> t0+125ms

    // Only the 125 ms since the denied call are credited: 0.5 + 0.5 = 1.
    EXPECT_DOUBLE_EQ(rl.acquire(1, t0 + 250ms), 0.0);
    EXPECT_DOUBLE_EQ(rl.tokens(), 0.0);
}

TEST(RateLimiter, RefillIsCappedAtBurst) {
    RateLimiter rl(makeConfig(100.0, 3));
    const auto t0 = RateLimiter::Clock::now();
    rl.acquire(3, t0);
    EXPECT_NEAR(rl.tokens(), 0.0, 1e-9);

    rl.acquire(0, t0 + 10s);  // long idle period
    EXPECT_DOUBLE_EQ(rl.tokens(), 3.0);
}

TEST(RateLimiter, StaleTimestampDoesNotDrainBucket) {
    RateLimiter rl(makeConfig(10.0, 2));
    const auto t0 = RateLimiter::Clock::now();
    rl.acquire(1, t0 + 1s);
    EXPECT_DOUBLE_EQ(rl.acquire(1, t0), 0.0);
    EXPECT_GE(rl.tokens(), 0.0);
}

TEST(RateLimiter, RealClockRefills) {
    RateLimiter rl(makeConfig(50.0, 1));
    ASSERT_DOUBLE_EQ(rl.acquire(), 0.0);
    const double wait = rl.acquire();
    EXPECT_GT(wait, 0.0);
    EXPECT_LE(wait, 0.02 + 1e-9);

    std::this_thread::sleep_for(40ms);
    EXPECT_DOUBLE_EQ(rl.acquire(), 0.0);
}

// ============================================================================
// Invariant under contention
// ============================================================================

TEST(RateLimiter, TokensStayWithinBoundsUnderContention) {
    const int burst = 20;
    RateLimiter rl(makeConfig(200.0, burst));
    std::atomic<int> granted{0};
    std::atomic<bool> outOfBounds{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (rl.acquire() == 0.0) ++granted;
                const double tokens = rl.tokens();
                if (tokens < 0.0 || tokens > burst) outOfBounds = true;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_FALSE(outOfBounds.load());
    EXPECT_GE(granted.load(), burst);
}
