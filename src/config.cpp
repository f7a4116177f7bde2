#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace fetch_engine {

void ClientConfig::validate() const {
    if (!(rateLimit.requestsPerSecond > 0.0)) {
        throw std::invalid_argument("rate_limit.requests_per_second must be > 0");
    }
    if (rateLimit.burstSize < 1) {
        throw std::invalid_argument("rate_limit.burst_size must be >= 1");
    }
    if (maxConcurrent < 1) {
        throw std::invalid_argument("max_concurrent must be >= 1");
    }
    if (retry.maxRetries < 0) {
        throw std::invalid_argument("retry.max_retries must be >= 0");
    }
    if (!(retry.baseDelay > 0.0) || !(retry.maxDelay > 0.0)) {
        throw std::invalid_argument("retry delays must be > 0");
    }
    if (retry.maxDelay < retry.baseDelay) {
        throw std::invalid_argument("retry.max_delay must be >= retry.base_delay");
    }
    if (!(retry.backoffMultiplier > 0.0)) {
        throw std::invalid_argument("retry.backoff_multiplier must be > 0");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be > 0");
    }
    if (pool.totalConnections < 1 || pool.perHostConnections < 1) {
        throw std::invalid_argument("connection limits must be >= 1");
    }
}

// ---------------------------------------------------------------------------
// JSON loading
// ---------------------------------------------------------------------------

namespace {

using json = nlohmann::json;

template <typename T>
void readKey(const json& obj, const char* key, T& out, const std::string& where) {
    if (!obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(where + ": bad value for '" + key + "': " + e.what());
    }
}

std::chrono::milliseconds secondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

const json& section(const json& root, const char* key, const std::string& where) {
    static const json kEmpty = json::object();
    if (!root.contains(key)) return kEmpty;
    const auto& s = root.at(key);
    if (!s.is_object()) {
        throw std::runtime_error(where + ": '" + key + "' must be an object");
    }
    return s;
}

} // namespace

ClientConfig loadClientConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json root;
    try {
        root = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error(path + ": root must be an object");
    }

    ClientConfig cfg;
    readKey(root, "base_url", cfg.baseUrl, path);
    readKey(root, "default_headers", cfg.defaultHeaders, path);
    readKey(root, "max_concurrent", cfg.maxConcurrent, path);
    readKey(root, "verbose", cfg.verbose, path);

    double timeoutSeconds = 0.0;
    if (root.contains("timeout")) {
        readKey(root, "timeout", timeoutSeconds, path);
        cfg.timeout = secondsToMs(timeoutSeconds);
    }

    const auto& rl = section(root, "rate_limit", path);
    readKey(rl, "requests_per_second", cfg.rateLimit.requestsPerSecond, path);
    readKey(rl, "burst_size", cfg.rateLimit.burstSize, path);

    const auto& rt = section(root, "retry", path);
    readKey(rt, "max_retries", cfg.retry.maxRetries, path);
    readKey(rt, "base_delay", cfg.retry.baseDelay, path);
    readKey(rt, "max_delay", cfg.retry.maxDelay, path);
    readKey(rt, "backoff_multiplier", cfg.retry.backoffMultiplier, path);
    readKey(rt, "retry_on_status", cfg.retry.retryOnStatus, path);

    const auto& pl = section(root, "pool", path);
    readKey(pl, "total_connections", cfg.pool.totalConnections, path);
    readKey(pl, "per_host_connections", cfg.pool.perHostConnections, path);

    double seconds = 0.0;
    if (pl.contains("keepalive")) {
        readKey(pl, "keepalive", seconds, path);
        cfg.pool.keepAlive = std::chrono::seconds(static_cast<long long>(seconds));
    }
    if (pl.contains("dns_cache_ttl")) {
        readKey(pl, "dns_cache_ttl", seconds, path);
        cfg.pool.dnsCacheTtl = std::chrono::seconds(static_cast<long long>(seconds));
    }
    if (pl.contains("connect_timeout")) {
        readKey(pl, "connect_timeout", seconds, path);
        cfg.pool.connectTimeout = secondsToMs(seconds);
    }

    return cfg;
}

} // namespace fetch_engine
