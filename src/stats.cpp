#include "stats.hpp"

namespace fetch_engine {

void StatsRecorder::recordResponse(double elapsedSeconds) {
    std::lock_guard<std::mutex> lock(mMutex);
    ++mStats.totalRequests;
    mStats.totalResponseTime += elapsedSeconds;
}

void StatsRecorder::recordRetry() {
    std::lock_guard<std::mutex> lock(mMutex);
    ++mStats.retriedRequests;
}

void StatsRecorder::recordRateLimitedWait() {
    std::lock_guard<std::mutex> lock(mMutex);
    ++mStats.rateLimitedWaits;
}

void StatsRecorder::recordOutcome(bool success) {
    std::lock_guard<std::mutex> lock(mMutex);
    if (success) {
        ++mStats.successfulRequests;
    } else {
        ++mStats.failedRequests;
    }
}

ClientStats StatsRecorder::snapshot() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mStats;
}

void StatsRecorder::reset() {
    std::lock_guard<std::mutex> lock(mMutex);
    mStats = ClientStats{};
}

} // namespace fetch_engine
