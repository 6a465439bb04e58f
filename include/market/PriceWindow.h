#pragma once

#include "common/Types.h"
#include <vector>
#include <optional>
#include <shared_mutex>

namespace tradebots {
namespace market {

// Fixed-capacity ring of recent samples for one asset.
// One appender, any number of readers; readers always get a copy.
class PriceWindow {
public:
    explicit PriceWindow(size_t capacity);

    // O(1). Evicts the oldest point when full.
    // Returns false for a point that is not newer than the newest entry.
    bool append(const PricePoint& point);

    // Most recent `count` points, oldest first
    std::vector<PricePoint> snapshot(size_t count) const;
    std::vector<PricePoint> snapshotAll() const;

    std::optional<PricePoint> latest() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    std::vector<PricePoint> copyRecentLocked(size_t count) const;

    const size_t capacity_;
    std::vector<PricePoint> buffer_;
    size_t head_;   // next write slot
    size_t size_;
    mutable std::shared_mutex mutex_;
};

} // namespace market
} // namespace tradebots
