#pragma once

#include "engine/CancellationToken.h"
#include "engine/EngineConfig.h"
#include "market/PriceHistoryStore.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace tradebots {
namespace feed {

// Stand-in for a live exchange feed. Backfills `backfill_points` synthetic
// samples per asset, then appends one sample per asset every `interval_ms`.
class SimulatedPriceFeed {
public:
    SimulatedPriceFeed(market::PriceHistoryStore& store, const engine::FeedConfig& config);
    ~SimulatedPriceFeed();

    SimulatedPriceFeed(const SimulatedPriceFeed&) = delete;
    SimulatedPriceFeed& operator=(const SimulatedPriceFeed&) = delete;

    void backfill();
    void start();
    void stop();
    bool isRunning() const { return thread_.joinable(); }

    // Appends one sample per asset at `timestamp_ms`
    void tick(long long timestamp_ms);

    // Slow trend + short wave + small noise around `reference`
    static double syntheticPrice(double reference, int64_t step);

private:
    void run();

    market::PriceHistoryStore& store_;
    engine::FeedConfig config_;
    std::map<std::string, int64_t> steps_;
    long long last_timestamp_ms_;

    std::unique_ptr<engine::CancellationToken> token_;
    std::thread thread_;
};

} // namespace feed
} // namespace tradebots
