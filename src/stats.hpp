#pragma once

#include <mutex>

namespace fetch_engine {

/// Aggregate counters for one client.
struct ClientStats {
    long   totalRequests      = 0;   // attempts that received an HTTP response
    long   successfulRequests = 0;
    long   failedRequests     = 0;
    long   retriedRequests    = 0;
    long   rateLimitedWaits   = 0;
    double totalResponseTime  = 0.0; // seconds, summed over totalRequests

    /// Percentage of totalRequests that ended successfully.
    double successRate() const {
        if (totalRequests == 0) return 0.0;
        return 100.0 * static_cast<double>(successfulRequests) /
               static_cast<double>(totalRequests);
    }

    double averageResponseTime() const {
        if (totalRequests == 0) return 0.0;
        return totalResponseTime / static_cast<double>(totalRequests);
    }
};

/// Thread-safe accumulator behind ApiClient::stats().
class StatsRecorder {
public:
    void recordResponse(double elapsedSeconds);
    void recordRetry();
    void recordRateLimitedWait();
    void recordOutcome(bool success);

    ClientStats snapshot() const;
    void reset();

private:
    mutable std::mutex mMutex;
    ClientStats        mStats{};
};

} // namespace fetch_engine
