#pragma once

#include "common/Types.h"
#include "market/PriceHistoryStore.h"
#include <string>
#include <vector>

namespace tradebots {
namespace feed {

class PriceHistoryLoader {
public:
    // Expected format: timestamp_ms,asset,price (header optional)
    static std::vector<PricePoint> loadCSV(const std::string& file_path);

    // Appends in timestamp order; returns the number of points accepted
    static size_t backfill(market::PriceHistoryStore& store, std::vector<PricePoint> points);
};

} // namespace feed
} // namespace tradebots
