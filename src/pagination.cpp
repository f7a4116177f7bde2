#include "pagination.hpp"

#include <iostream>
#include <stdexcept>

namespace fetch_engine {

bool shouldContinuePagination(const ResponseRecord& response, int pageSize) {
    if (!response.success()) return false;

    const auto& body = response.body;
    if (body.is_array()) {
        return static_cast<int>(body.size()) >= pageSize;
    }
    if (body.is_object() && body.contains("items") && body["items"].is_array()) {
        return static_cast<int>(body["items"].size()) >= pageSize;
    }
    return false;
}

int Paginator::countItems(const nlohmann::json& body) {
    if (body.is_array()) return static_cast<int>(body.size());
    if (body.is_object() && body.contains("items") && body["items"].is_array()) {
        return static_cast<int>(body["items"].size());
    }
    return 0;
}

Paginator::Paginator(RequestExecutor& executor, bool verbose)
    : mExecutor(executor)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: paginated fetch
// ---------------------------------------------------------------------------

std::vector<ResponseRecord>
Paginator::fetchPages(const RequestDescriptor& base, const PaginationOptions& options)
{
    if (options.pageSize < 1) {
        throw std::invalid_argument("page size must be >= 1");
    }

    std::vector<ResponseRecord> pages;
    mStats = Stats{};

    if (mVerbose) {
        std::cerr << "[Paginator] Starting paginated fetch of " << base.url
                  << " with page size " << options.pageSize << "\n";
    }

    for (int page = 1; !options.maxPages || page <= *options.maxPages; ++page) {
        RequestDescriptor request = base;
        request.params[options.pageParam] = std::to_string(page);
        request.params[options.sizeParam] = std::to_string(options.pageSize);
        request.metadata.page = page;

        if (mVerbose) {
            std::cerr << "[Paginator] Fetching page " << page << "\n";
        }

        ResponseRecord response;
        try {
            response = mExecutor.execute(request);
        } catch (const std::exception& e) {
            std::cerr << "[Paginator] Page " << page << " failed after retries: "
                      << e.what() << "; stopping.\n";
            mStats.stoppedOnError = true;
            break;
        }

        const int items = countItems(response.body);
        ++mStats.pagesFetched;
        mStats.itemsFetched += items;

        if (mVerbose) {
            std::cerr << "[Paginator] Page " << page << ": HTTP " << response.status
                      << ", " << items << " items (total so far: "
                      << mStats.itemsFetched << ")\n";
        }

        pages.push_back(std::move(response));

        if (!options.shouldContinue || !options.shouldContinue(pages.back(), options.pageSize)) {
            if (mVerbose) {
                std::cerr << "[Paginator] No more pages.\n";
            }
            break;
        }
    }

    if (mVerbose) {
        std::cerr << "[Paginator] Paginated fetch complete: " << pages.size()
                  << " pages\n";
    }
    return pages;
}

} // namespace fetch_engine
