#pragma once

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace fetch_engine {

/// Token-bucket parameters.
struct RateLimitConfig {
    double requestsPerSecond = 10.0;
    int    burstSize         = 50;
};

/// Retry/backoff parameters. Delays are in seconds.
struct RetryConfig {
    int           maxRetries        = 3;
    double        baseDelay         = 1.0;
    double        maxDelay          = 60.0;
    double        backoffMultiplier = 2.0;
    std::set<int> retryOnStatus     = {429, 500, 502, 503, 504};
};

/// Limits handed to the transport.
struct ConnectionPoolConfig {
    int                       totalConnections   = 100;
    int                       perHostConnections = 30;
    std::chrono::seconds      keepAlive{60};
    std::chrono::seconds      dnsCacheTtl{300};
    std::chrono::milliseconds connectTimeout{10000};
};

struct ClientConfig {
    std::string                        baseUrl;
    std::map<std::string, std::string> defaultHeaders;
    std::chrono::milliseconds          timeout{30000};
    int                                maxConcurrent = 10;
    RateLimitConfig                    rateLimit;
    RetryConfig                        retry;
    ConnectionPoolConfig               pool;
    bool                               verbose = false;

    /// Throws std::invalid_argument describing the first bad value.
    void validate() const;
};

/// Read a ClientConfig from a JSON file. Keys are snake_case, durations are
/// in seconds, and missing keys keep their defaults.
/// @throws std::runtime_error if the file is unreadable or malformed.
ClientConfig loadClientConfig(const std::string& path);

} // namespace fetch_engine
