#pragma once

#include <condition_variable>
#include <mutex>

namespace fetch_engine {

/// Counting semaphore bounding in-flight attempts across a client.
class ConcurrencyGate {
public:
    /// RAII slot: acquired on construction, released on destruction.
    class Slot {
    public:
        explicit Slot(ConcurrencyGate& gate) : mGate(gate) { mGate.acquire(); }
        ~Slot() { mGate.release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        ConcurrencyGate& mGate;
    };

    explicit ConcurrencyGate(int maxConcurrent);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Blocks while the gate is at capacity.
    void acquire();
    void release();

    int capacity() const { return mCapacity; }
    int inFlight() const;

private:
    const int               mCapacity;
    int                     mInFlight = 0;
    mutable std::mutex      mMutex;
    std::condition_variable mSlotFreed;
};

} // namespace fetch_engine
