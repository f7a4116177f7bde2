#include "batch.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>

namespace fetch_engine {

BatchCoordinator::BatchCoordinator(RequestExecutor& executor, bool verbose)
    : mExecutor(executor)
    , mVerbose(verbose) {}

std::vector<ResponseRecord>
BatchCoordinator::submit(std::vector<RequestDescriptor> requests,
                         const ProgressCallback& progress)
{
    const std::size_t total = requests.size();
    std::vector<ResponseRecord> results;
    if (total == 0) return results;
    results.reserve(total);

    if (mVerbose) {
        std::cerr << "[BatchCoordinator] Starting batch of " << total
                  << " requests\n";
    }

    // --- tag each request with its submission index ---
    for (std::size_t i = 0; i < total; ++i) {
        requests[i].metadata.batchIndex = i;
    }

    std::mutex  resultsMutex;
    std::size_t completed = 0;

    auto onComplete = [&](ResponseRecord record) {
        std::size_t done = 0;
        {
            std::lock_guard<std::mutex> lock(resultsMutex);
            results.push_back(std::move(record));
            done = ++completed;
        }

        // Invoked outside the lock; calls may overlap and arrive out of order.
        if (progress) {
            try {
                progress(done, total);
            } catch (const std::exception& e) {
                std::cerr << "[BatchCoordinator] Progress callback threw: "
                          << e.what() << "\n";
            }
        }
        if (mVerbose && (done % 10 == 0 || done == total)) {
            std::cerr << "[BatchCoordinator] Completed " << done << "/"
                      << total << " requests\n";
        }
    };

    // --- dispatch ---
    {
        boost::asio::thread_pool pool(std::min(total, kMaxWorkers));

        for (const auto& request : requests) {
            boost::asio::post(pool, [this, &request, &onComplete] {
                ResponseRecord record;
                try {
                    record = mExecutor.execute(request);
                } catch (const std::exception& e) {
                    std::cerr << "[BatchCoordinator] Request " << *request.metadata.batchIndex
                              << " (" << request.url << ") failed: " << e.what() << "\n";
                    record = makePlaceholder(request, e.what());
                }
                onComplete(std::move(record));
            });
        }

        pool.join();
    }

    // --- restore submission order ---
    std::sort(results.begin(), results.end(),
              [](const ResponseRecord& a, const ResponseRecord& b) {
                  return a.metadata.batchIndex.value_or(0) <
                         b.metadata.batchIndex.value_or(0);
              });

    if (mVerbose) {
        std::cerr << "[BatchCoordinator] Batch complete: " << results.size()
                  << " responses\n";
    }
    return results;
}

ResponseRecord BatchCoordinator::makePlaceholder(const RequestDescriptor& request,
                                                 const std::string& error)
{
    ResponseRecord record;
    record.status      = 0;
    record.body        = {{"error", error}};
    record.url         = request.url;
    record.completedAt = std::chrono::system_clock::now();
    record.metadata    = request.metadata;
    return record;
}

} // namespace fetch_engine
