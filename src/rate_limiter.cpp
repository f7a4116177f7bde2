#include "rate_limiter.hpp"

#include <algorithm>

namespace fetch_engine {

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : mConfig(config)
    , mTokens(static_cast<double>(config.burstSize))
    , mLastUpdate(Clock::now()) {}

double RateLimiter::acquire(int tokensNeeded) {
    return acquire(tokensNeeded, Clock::now());
}

double RateLimiter::acquire(int tokensNeeded, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mMutex);

    // A caller-supplied clock may lag the last update; never refill negatively.
    const double elapsed =
        std::max(0.0, std::chrono::duration<double>(now - mLastUpdate).count());

    mTokens = std::min(static_cast<double>(mConfig.burstSize),
                       mTokens + elapsed * mConfig.requestsPerSecond);
    mLastUpdate = std::max(mLastUpdate, now);

    const double needed = static_cast<double>(tokensNeeded);
    if (mTokens >= needed) {
        mTokens -= needed;
        return 0.0;
    }

    const double deficit = needed - mTokens;
    return deficit / mConfig.requestsPerSecond;
}

double RateLimiter::tokens() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTokens;
}

} // namespace fetch_engine
