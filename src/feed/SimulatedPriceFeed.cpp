#include "feed/SimulatedPriceFeed.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace tradebots {
namespace feed {

SimulatedPriceFeed::SimulatedPriceFeed(market::PriceHistoryStore& store, const engine::FeedConfig& config)
    : store_(store)
    , config_(config)
    , last_timestamp_ms_(0)
{}

SimulatedPriceFeed::~SimulatedPriceFeed() {
    stop();
}

double SimulatedPriceFeed::syntheticPrice(double reference, int64_t step) {
    const double i = static_cast<double>(step);
    const double trend = std::sin(i / 100.0) * reference * 0.01;
    const double short_term = std::sin(i / 20.0) * reference * 0.005;
    const double noise = std::sin(i * 7.0) * reference * 0.0002;
    return reference + trend + short_term + noise;
}

void SimulatedPriceFeed::backfill() {
    const long long now = currentTimeMs();
    const int points = std::max(0, config_.backfill_points);

    for (const auto& [asset, reference] : config_.assets) {
        int64_t& step = steps_[asset];
        for (int i = points; i > 0; --i) {
            const long long ts = now - static_cast<long long>(i) * config_.interval_ms;
            store_.append(PricePoint(ts, asset, syntheticPrice(reference, step++)));
        }
        LOG_INFO("Backfilled {} with {} simulated points", asset, points);
    }
    last_timestamp_ms_ = now - config_.interval_ms;
}

void SimulatedPriceFeed::tick(long long timestamp_ms) {
    // Keep timestamps strictly increasing even if the clock stalls
    const long long ts = std::max(timestamp_ms, last_timestamp_ms_ + 1);
    for (const auto& [asset, reference] : config_.assets) {
        int64_t& step = steps_[asset];
        store_.append(PricePoint(ts, asset, syntheticPrice(reference, step++)));
    }
    last_timestamp_ms_ = ts;
}

void SimulatedPriceFeed::start() {
    if (thread_.joinable()) {
        return;
    }
    token_ = std::make_unique<engine::CancellationToken>();
    thread_ = std::thread(&SimulatedPriceFeed::run, this);
    LOG_INFO("Simulated price feed started ({} assets, {} ms interval)",
             config_.assets.size(), config_.interval_ms);
}

void SimulatedPriceFeed::stop() {
    if (!thread_.joinable()) {
        return;
    }
    token_->requestStop();
    thread_.join();
    LOG_INFO("Simulated price feed stopped");
}

void SimulatedPriceFeed::run() {
    const auto interval = std::chrono::milliseconds(config_.interval_ms);
    while (!token_->waitFor(interval)) {
        tick(currentTimeMs());
    }
}

} // namespace feed
} // namespace tradebots
