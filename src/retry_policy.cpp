#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace fetch_engine {

double RetryPolicy::calculateDelay(int attempt) const {
    const double delay =
        mConfig.baseDelay * std::pow(mConfig.backoffMultiplier, attempt);
    return std::min(delay, mConfig.maxDelay);
}

} // namespace fetch_engine
