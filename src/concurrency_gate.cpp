#include "concurrency_gate.hpp"

#include <stdexcept>

namespace fetch_engine {

ConcurrencyGate::ConcurrencyGate(int maxConcurrent)
    : mCapacity(maxConcurrent)
{
    if (maxConcurrent < 1) {
        throw std::invalid_argument("ConcurrencyGate capacity must be >= 1");
    }
}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lock(mMutex);
    mSlotFreed.wait(lock, [this] { return mInFlight < mCapacity; });
    ++mInFlight;
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mInFlight > 0) --mInFlight;
    }
    mSlotFreed.notify_one();
}

int ConcurrencyGate::inFlight() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mInFlight;
}

} // namespace fetch_engine
