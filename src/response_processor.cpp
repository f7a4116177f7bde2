#include "response_processor.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace fetch_engine {

std::vector<nlohmann::json>
ResponseProcessor::process(const std::vector<ResponseRecord>& responses,
                           const ProcessFn& fn,
                           std::size_t batchSize)
{
    if (batchSize == 0) {
        throw std::invalid_argument("batch size must be >= 1");
    }

    std::vector<nlohmann::json> out;
    out.reserve(responses.size());

    for (std::size_t begin = 0; begin < responses.size(); begin += batchSize) {
        const std::size_t end = std::min(responses.size(), begin + batchSize);

        for (std::size_t i = begin; i < end; ++i) {
            const auto& response = responses[i];
            if (!response.success()) {
                std::cerr << "[ResponseProcessor] Skipping failed response: HTTP "
                          << response.status << " " << response.url << "\n";
                ++mErrors;
                continue;
            }
            try {
                out.push_back(fn(response.body));
                ++mProcessed;
            } catch (const std::exception& e) {
                std::cerr << "[ResponseProcessor] Error processing "
                          << response.url << ": " << e.what() << "\n";
                ++mErrors;
            }
        }

        if (mVerbose) {
            std::cerr << "[ResponseProcessor] Processed " << end << "/"
                      << responses.size() << " responses\n";
        }
    }

    if (mVerbose) {
        std::cerr << "[ResponseProcessor] Done: " << mProcessed << " processed, "
                  << mErrors << " errors\n";
    }
    return out;
}

} // namespace fetch_engine
