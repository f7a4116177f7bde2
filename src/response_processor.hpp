#pragma once

#include "models.hpp"

#include <cstddef>
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

namespace fetch_engine {

/// Hands the bodies of successful responses to a downstream function.
/// Unsuccessful responses and bodies the function throws on are counted
/// as errors and left out of the result.
class ResponseProcessor {
public:
    using ProcessFn = std::function<nlohmann::json(const nlohmann::json& body)>;

    explicit ResponseProcessor(bool verbose = false) : mVerbose(verbose) {}

    std::vector<nlohmann::json> process(const std::vector<ResponseRecord>& responses,
                                        const ProcessFn& fn,
                                        std::size_t batchSize = 100);

    int processedCount() const { return mProcessed; }
    int errorCount() const { return mErrors; }

private:
    bool mVerbose;
    int  mProcessed = 0;
    int  mErrors    = 0;
};

} // namespace fetch_engine
