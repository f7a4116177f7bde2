#pragma once

#include "config.hpp"

namespace fetch_engine {

/// Exponential backoff without jitter, plus the retryable-status check.
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config) : mConfig(config) {}

    /// min(base * multiplier^attempt, max), in seconds. attempt is 0-based.
    double calculateDelay(int attempt) const;

    bool isRetryableStatus(int status) const {
        return mConfig.retryOnStatus.count(status) != 0;
    }

    int maxRetries() const { return mConfig.maxRetries; }
    int maxAttempts() const { return mConfig.maxRetries + 1; }

    const RetryConfig& config() const { return mConfig; }

private:
    RetryConfig mConfig;
};

} // namespace fetch_engine
