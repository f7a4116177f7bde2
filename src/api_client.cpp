#include "api_client.hpp"
#include "beast_transport.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fetch_engine {

namespace {

ClientConfig validated(ClientConfig config) {
    config.validate();
    return config;
}

std::unique_ptr<HttpTransport> makeBeastTransport(const ClientConfig& config) {
    return std::make_unique<BeastTransport>(config.pool, config.verbose);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ApiClient::ApiClient(ClientConfig config, TransportFactory factory)
    : mConfig(validated(std::move(config)))
    , mFactory(factory ? std::move(factory) : TransportFactory(makeBeastTransport))
    , mLimiter(mConfig.rateLimit)
    , mGate(mConfig.maxConcurrent)
    , mExecutor(mConfig,
                [this]() -> HttpTransport& { return ensureTransport(); },
                mLimiter, mGate, mStats)
    , mBatch(mExecutor, mConfig.verbose) {}

ApiClient::~ApiClient() {
    close();
}

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------

void ApiClient::open() {
    ensureTransport();
}

void ApiClient::close() {
    std::unique_ptr<HttpTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mTransportMutex);
        transport = std::move(mTransport);
    }
    if (!transport) return;

    transport->close();
    if (mConfig.verbose) {
        std::cerr << "[ApiClient] Closed transport\n";
    }
}

bool ApiClient::isOpen() const {
    std::lock_guard<std::mutex> lock(mTransportMutex);
    return mTransport != nullptr;
}

HttpTransport& ApiClient::ensureTransport() {
    std::lock_guard<std::mutex> lock(mTransportMutex);
    if (!mTransport) {
        mTransport = mFactory(mConfig);
        if (!mTransport) {
            throw std::runtime_error("Transport factory returned no transport");
        }
        if (mConfig.verbose) {
            const auto& pool = mConfig.pool;
            std::cerr << "[ApiClient] Opened transport (connections="
                      << pool.totalConnections << ", per-host="
                      << pool.perHostConnections << ", keepalive="
                      << pool.keepAlive.count() << "s, dns ttl="
                      << pool.dnsCacheTtl.count() << "s)\n";
        }
    }
    return *mTransport;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

ResponseRecord ApiClient::request(const RequestDescriptor& request) {
    return mExecutor.execute(request);
}

std::vector<ResponseRecord>
ApiClient::batch(std::vector<RequestDescriptor> requests,
                 const BatchCoordinator::ProgressCallback& progress)
{
    // Setup failures surface here rather than as per-item placeholders.
    ensureTransport();
    return mBatch.submit(std::move(requests), progress);
}

std::vector<ResponseRecord>
ApiClient::paginate(const RequestDescriptor& base, const PaginationOptions& options)
{
    ensureTransport();
    Paginator paginator(mExecutor, mConfig.verbose);
    return paginator.fetchPages(base, options);
}

} // namespace fetch_engine
