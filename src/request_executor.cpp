#include "request_executor.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <strings.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace fetch_engine {

namespace {

void sleepSeconds(double seconds) {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

bool hasHeader(const std::map<std::string, std::string>& headers,
               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) return true;
    }
    return false;
}

} // namespace

RequestExecutor::RequestExecutor(const ClientConfig& config,
                                 TransportProvider transport,
                                 RateLimiter& limiter,
                                 ConcurrencyGate& gate,
                                 StatsRecorder& stats)
    : mConfig(config)
    , mTransport(std::move(transport))
    , mLimiter(limiter)
    , mGate(gate)
    , mStats(stats)
    , mPolicy(config.retry) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ResponseRecord RequestExecutor::execute(const RequestDescriptor& request) {
    // --- rate limit ---
    const double wait = mLimiter.acquire();
    if (wait > 0.0) {
        mStats.recordRateLimitedWait();
        if (mConfig.verbose || wait >= 1.0) {
            std::cerr << "[RequestExecutor] Rate limit: waiting " << wait
                      << "s before " << request.url << "\n";
        }
        sleepSeconds(wait);
    }

    // --- concurrency gate (released on every exit path) ---
    ConcurrencyGate::Slot slot(mGate);
    return executeWithRetry(request);
}

PreparedRequest RequestExecutor::prepare(const RequestDescriptor& request) const {
    PreparedRequest prepared;
    prepared.method = request.method;
    prepared.url    = appendQuery(resolveUrl(mConfig.baseUrl, request.url),
                                  request.params);

    // Throws std::invalid_argument for anything the transport cannot reach.
    parseUrl(prepared.url);

    prepared.headers = mConfig.defaultHeaders;
    for (const auto& [name, value] : request.headers) {
        prepared.headers[name] = value;
    }

    if (request.body) {
        const bool typed = hasHeader(prepared.headers, "Content-Type");
        if (request.body->is_string()) {
            prepared.body = request.body->get<std::string>();
            if (!typed) prepared.headers["Content-Type"] = "text/plain";
        } else {
            prepared.body = request.body->dump();
            if (!typed) prepared.headers["Content-Type"] = "application/json";
        }
    }
    return prepared;
}

// ---------------------------------------------------------------------------
// Private: retry loop
// ---------------------------------------------------------------------------

ResponseRecord RequestExecutor::executeWithRetry(const RequestDescriptor& request) {
    PreparedRequest prepared;
    try {
        prepared = prepare(request);
    } catch (const std::invalid_argument&) {
        mStats.recordOutcome(false);
        throw;
    }

    const auto timeout     = request.timeout.value_or(mConfig.timeout);
    const int  maxAttempts = mPolicy.maxAttempts();

    HttpTransport& transport = mTransport();
    std::string lastError;

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        const bool attemptsRemain = attempt + 1 < maxAttempts;
        const auto start = std::chrono::steady_clock::now();

        RawResponse raw;
        try {
            raw = transport.send(prepared, timeout);
        } catch (const std::exception& e) {
            // Timeout, connection failure or anything else below HTTP.
            lastError = e.what();

            std::cerr << "[Retry] " << toString(prepared.method) << " " << prepared.url
                      << " network error: " << e.what() << ", attempt "
                      << (attempt + 1) << "/" << maxAttempts << "\n";

            if (!attemptsRemain) break;

            mStats.recordRetry();
            sleepSeconds(mPolicy.calculateDelay(attempt));
            continue;
        }

        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        mStats.recordResponse(elapsed);

        ResponseRecord record = buildRecord(raw, elapsed, request.metadata);

        if (mPolicy.isRetryableStatus(record.status) && attemptsRemain) {
            mStats.recordRetry();
            const double delay = mPolicy.calculateDelay(attempt);

            std::cerr << "[Retry] HTTP " << record.status << " from " << prepared.url
                      << ", attempt " << (attempt + 1) << "/" << maxAttempts
                      << ", backoff " << delay << "s\n";

            sleepSeconds(delay);
            continue;
        }

        mStats.recordOutcome(record.success());

        if (mConfig.verbose) {
            std::cerr << "[RequestExecutor] " << toString(prepared.method) << " "
                      << prepared.url << " -> HTTP " << record.status << " in "
                      << elapsed << "s\n";
        }
        return record;
    }

    mStats.recordOutcome(false);
    throw ExhaustedRetriesError(maxAttempts, prepared.url, lastError);
}

ResponseRecord RequestExecutor::buildRecord(const RawResponse& raw,
                                            double elapsedSeconds,
                                            const RequestMetadata& metadata)
{
    ResponseRecord record;
    record.status         = raw.status;
    record.body           = decodeBody(raw.header("Content-Type"), raw.body);
    record.headers        = raw.headers;
    record.url            = raw.url;
    record.elapsedSeconds = elapsedSeconds;
    record.completedAt    = std::chrono::system_clock::now();
    record.metadata       = metadata;
    return record;
}

} // namespace fetch_engine
