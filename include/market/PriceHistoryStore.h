#pragma once

#include "market/PriceWindow.h"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradebots {
namespace market {

// System-wide price history: one PriceWindow per asset.
// The asset map is only write-locked when an asset is seen for the first time,
// so appends to one asset never block readers of another.
class PriceHistoryStore {
public:
    explicit PriceHistoryStore(size_t window_capacity);

    bool append(const PricePoint& point);

    std::vector<PricePoint> snapshot(const Asset& asset, size_t count) const;

    // USD price of one unit of asset (USD itself is 1)
    std::optional<double> latestUsdPrice(const Asset& asset) const;

    // Price of base denominated in quote
    std::optional<double> pairPrice(const Asset& base, const Asset& quote) const;

    // Newest sample time, for staleness checks
    std::optional<long long> newestTimestamp(const Asset& asset) const;

    std::vector<Asset> assets() const;

private:
    std::shared_ptr<PriceWindow> findWindow(const Asset& asset) const;

    const size_t window_capacity_;
    std::map<Asset, std::shared_ptr<PriceWindow>> windows_;
    mutable std::shared_mutex mutex_;
};

} // namespace market
} // namespace tradebots
