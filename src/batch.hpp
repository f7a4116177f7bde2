#pragma once

#include "models.hpp"
#include "request_executor.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace fetch_engine {

/// Fans a list of requests out concurrently and returns one ResponseRecord
/// per request, in submission order.  A request that fails outright is
/// replaced by a status-0 placeholder carrying {"error": <message>}.
class BatchCoordinator {
public:
    /// Called after every completion with (completed, total), from worker
    /// threads and possibly concurrently. Must be thread-safe.
    using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

    explicit BatchCoordinator(RequestExecutor& executor, bool verbose = false);

    std::vector<ResponseRecord> submit(std::vector<RequestDescriptor> requests,
                                       const ProgressCallback& progress = nullptr);

private:
    static constexpr std::size_t kMaxWorkers = 64;

    RequestExecutor& mExecutor;
    bool             mVerbose;

    static ResponseRecord makePlaceholder(const RequestDescriptor& request,
                                          const std::string& error);
};

} // namespace fetch_engine
