#pragma once

#include "config.hpp"

#include <chrono>
#include <mutex>

namespace fetch_engine {

/// Token-bucket admission control shared by every request of a client.
///
/// acquire() never blocks: it returns how long the caller has to wait
/// before the tokens it asked for would be available.  The bucket clock
/// advances on every call, including calls that are told to wait, and a
/// call that is told to wait does not spend any tokens.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(const RateLimitConfig& config);

    /// @return seconds to wait; 0.0 when the tokens were granted.
    double acquire(int tokensNeeded = 1);

    /// Same as acquire(), with an explicit "now" for deterministic callers.
    double acquire(int tokensNeeded, Clock::time_point now);

    // ---- accessors ----
    double tokens() const;
    const RateLimitConfig& config() const { return mConfig; }

private:
    RateLimitConfig    mConfig;
    double             mTokens;
    Clock::time_point  mLastUpdate;
    mutable std::mutex mMutex;
};

} // namespace fetch_engine
