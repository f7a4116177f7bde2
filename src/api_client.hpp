#pragma once

#include "batch.hpp"
#include "concurrency_gate.hpp"
#include "config.hpp"
#include "models.hpp"
#include "pagination.hpp"
#include "rate_limiter.hpp"
#include "request_executor.hpp"
#include "stats.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace fetch_engine {

/// Entry point: owns the transport, the shared RateLimiter and
/// ConcurrencyGate, and the aggregate statistics.
///
/// The transport is created by open() or lazily by the first request, and
/// released by close() or the destructor.  close() must not race requests
/// that are still in flight.
class ApiClient {
public:
    using TransportFactory =
        std::function<std::unique_ptr<HttpTransport>(const ClientConfig&)>;

    /// @param factory  Creates the transport; defaults to a BeastTransport.
    /// @throws std::invalid_argument if @p config does not validate.
    explicit ApiClient(ClientConfig config, TransportFactory factory = nullptr);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    /// @throws std::runtime_error if the transport cannot be created.
    void open();
    void close();
    bool isOpen() const;

    /// Single request.  Throws ExhaustedRetriesError (no response at all),
    /// std::invalid_argument (unresolvable URL) or std::runtime_error
    /// (transport could not be opened); never for a non-2xx status.
    ResponseRecord request(const RequestDescriptor& request);

    /// Concurrent batch, results in submission order, never throws per item.
    std::vector<ResponseRecord> batch(std::vector<RequestDescriptor> requests,
                                      const BatchCoordinator::ProgressCallback& progress = nullptr);

    /// Sequential page walk; stops early (partial result) on a failed page.
    std::vector<ResponseRecord> paginate(const RequestDescriptor& base,
                                         const PaginationOptions& options = {});

    ClientStats stats() const { return mStats.snapshot(); }
    void resetStats() { mStats.reset(); }

    const ClientConfig& config() const { return mConfig; }
    const RateLimiter& rateLimiter() const { return mLimiter; }
    const ConcurrencyGate& gate() const { return mGate; }

private:
    ClientConfig     mConfig;
    TransportFactory mFactory;
    RateLimiter      mLimiter;
    ConcurrencyGate  mGate;
    StatsRecorder    mStats;

    mutable std::mutex             mTransportMutex;
    std::unique_ptr<HttpTransport> mTransport;

    RequestExecutor  mExecutor;
    BatchCoordinator mBatch;

    HttpTransport& ensureTransport();
};

} // namespace fetch_engine
