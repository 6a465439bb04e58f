#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tradebots {
namespace engine {

// Checked by a bot task at its suspension points.
// Stop lets the current cycle finish cleanly; abort is for faults.
class CancellationToken {
public:
    void requestStop();
    void requestAbort();

    bool stopRequested() const { return stop_.load(); }
    bool abortRequested() const { return abort_.load(); }
    bool cancelled() const { return stopRequested() || abortRequested(); }

    // Sleeps up to `timeout`; returns true if woken by a cancellation
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    void notify();

    std::atomic<bool> stop_{false};
    std::atomic<bool> abort_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace engine
} // namespace tradebots
