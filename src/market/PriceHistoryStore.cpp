#include "market/PriceHistoryStore.h"
#include <mutex>

namespace tradebots {
namespace market {

PriceHistoryStore::PriceHistoryStore(size_t window_capacity)
    : window_capacity_(window_capacity)
{}

bool PriceHistoryStore::append(const PricePoint& point) {
    auto window = findWindow(point.asset);
    if (!window) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = windows_[point.asset];
        if (!slot) {
            slot = std::make_shared<PriceWindow>(window_capacity_);
        }
        window = slot;
    }
    return window->append(point);
}

std::vector<PricePoint> PriceHistoryStore::snapshot(const Asset& asset, size_t count) const {
    auto window = findWindow(asset);
    if (!window) {
        return {};
    }
    return window->snapshot(count);
}

std::optional<double> PriceHistoryStore::latestUsdPrice(const Asset& asset) const {
    if (asset == kUsd) {
        return 1.0;
    }
    auto window = findWindow(asset);
    if (!window) {
        return std::nullopt;
    }
    auto point = window->latest();
    if (!point) {
        return std::nullopt;
    }
    return point->price;
}

std::optional<double> PriceHistoryStore::pairPrice(const Asset& base, const Asset& quote) const {
    auto base_usd = latestUsdPrice(base);
    auto quote_usd = latestUsdPrice(quote);
    if (!base_usd || !quote_usd || *quote_usd <= 0.0) {
        return std::nullopt;
    }
    return *base_usd / *quote_usd;
}

std::optional<long long> PriceHistoryStore::newestTimestamp(const Asset& asset) const {
    auto window = findWindow(asset);
    if (!window) {
        return std::nullopt;
    }
    auto point = window->latest();
    if (!point) {
        return std::nullopt;
    }
    return point->timestamp_ms;
}

std::vector<Asset> PriceHistoryStore::assets() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Asset> out;
    out.reserve(windows_.size());
    for (const auto& [asset, window] : windows_) {
        out.push_back(asset);
    }
    return out;
}

std::shared_ptr<PriceWindow> PriceHistoryStore::findWindow(const Asset& asset) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = windows_.find(asset);
    if (it == windows_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace market
} // namespace tradebots
