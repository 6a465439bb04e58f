#include "market/PriceWindow.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace tradebots {
namespace market {

PriceWindow::PriceWindow(size_t capacity)
    : capacity_(capacity)
    , head_(0)
    , size_(0)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("PriceWindow capacity must be positive");
    }
    buffer_.resize(capacity_);
}

bool PriceWindow::append(const PricePoint& point) {
    if (!std::isfinite(point.price) || point.price <= 0.0) {
        LOG_WARN("{} point at {} rejected: price {} is not a positive number",
                 point.asset, point.timestamp_ms, point.price);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (size_ > 0) {
        const auto& newest = buffer_[(head_ + capacity_ - 1) % capacity_];
        if (point.timestamp_ms <= newest.timestamp_ms) {
            LOG_WARN("{} point at {} rejected: not newer than {}",
                     point.asset, point.timestamp_ms, newest.timestamp_ms);
            return false;
        }
    }

    buffer_[head_] = point;
    head_ = (head_ + 1) % capacity_;
    if (size_ < capacity_) {
        ++size_;
    }
    return true;
}

std::vector<PricePoint> PriceWindow::snapshot(size_t count) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return copyRecentLocked(count);
}

std::vector<PricePoint> PriceWindow::snapshotAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return copyRecentLocked(size_);
}

std::optional<PricePoint> PriceWindow::latest() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (size_ == 0) {
        return std::nullopt;
    }
    return buffer_[(head_ + capacity_ - 1) % capacity_];
}

size_t PriceWindow::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return size_;
}

std::vector<PricePoint> PriceWindow::copyRecentLocked(size_t count) const {
    const size_t n = std::min(count, size_);
    std::vector<PricePoint> out;
    out.reserve(n);

    // oldest of the requested range
    size_t idx = (head_ + capacity_ - n) % capacity_;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(buffer_[idx]);
        idx = (idx + 1) % capacity_;
    }
    return out;
}

} // namespace market
} // namespace tradebots
