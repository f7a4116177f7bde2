#pragma once

#include "models.hpp"
#include "request_executor.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetch_engine {

/// Decides whether another page should be requested after @p response.
using StopPredicate = std::function<bool(const ResponseRecord& response, int pageSize)>;

/// Default continuation rule: the page succeeded and returned a full page,
/// either as a top-level array or as an object's "items" array.
bool shouldContinuePagination(const ResponseRecord& response, int pageSize);

struct PaginationOptions {
    std::string        pageParam = "page";
    std::string        sizeParam = "size";
    int                pageSize  = 100;
    std::optional<int> maxPages;
    StopPredicate      shouldContinue = shouldContinuePagination;
};

/// Walks page=1,2,... sequentially through the executor.  A page that
/// throws ends the walk; everything fetched before it is returned.
class Paginator {
public:
    struct Stats {
        int  pagesFetched   = 0;
        int  itemsFetched   = 0;
        bool stoppedOnError = false;
    };

    explicit Paginator(RequestExecutor& executor, bool verbose = false);

    std::vector<ResponseRecord> fetchPages(const RequestDescriptor& base,
                                           const PaginationOptions& options = {});

    Stats getStats() const { return mStats; }

    /// Number of items in a page body (array, or object with "items"), else 0.
    static int countItems(const nlohmann::json& body);

private:
    RequestExecutor& mExecutor;
    bool             mVerbose;
    Stats            mStats{};
};

} // namespace fetch_engine
