#pragma once

#include "concurrency_gate.hpp"
#include "config.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "stats.hpp"
#include "transport.hpp"

#include <chrono>
#include <functional>

namespace fetch_engine {

/// Runs one logical request to completion: rate limit, concurrency slot,
/// then up to max_retries + 1 attempts with exponential backoff.
class RequestExecutor {
public:
    /// Yields the transport to send on.  May open it lazily; whatever it
    /// throws propagates to the caller untouched.
    using TransportProvider = std::function<HttpTransport&()>;

    RequestExecutor(const ClientConfig& config,
                    TransportProvider transport,
                    RateLimiter& limiter,
                    ConcurrencyGate& gate,
                    StatsRecorder& stats);

    /// Returns the final ResponseRecord, successful or not.  A retryable
    /// status that survives every attempt is returned, not thrown.
    /// @throws ExhaustedRetriesError if no attempt received a response.
    /// @throws std::invalid_argument if the request URL cannot be resolved.
    ResponseRecord execute(const RequestDescriptor& request);

    /// Resolve URL and query, merge headers and serialize the body.
    PreparedRequest prepare(const RequestDescriptor& request) const;

    const RetryPolicy& retryPolicy() const { return mPolicy; }

private:
    const ClientConfig& mConfig;
    TransportProvider   mTransport;
    RateLimiter&        mLimiter;
    ConcurrencyGate&    mGate;
    StatsRecorder&      mStats;
    RetryPolicy         mPolicy;

    ResponseRecord executeWithRetry(const RequestDescriptor& request);

    static ResponseRecord buildRecord(const RawResponse& raw,
                                      double elapsedSeconds,
                                      const RequestMetadata& metadata);
};

} // namespace fetch_engine
