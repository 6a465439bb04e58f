#include "engine/CancellationToken.h"

namespace tradebots {
namespace engine {

void CancellationToken::requestStop() {
    stop_.store(true);
    notify();
}

void CancellationToken::requestAbort() {
    abort_.store(true);
    notify();
}

void CancellationToken::notify() {
    // Lock so a waiter between its predicate check and wait() cannot miss it
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled(); });
}

} // namespace engine
} // namespace tradebots
