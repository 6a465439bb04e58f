#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <memory>
#include <string>
#include <vector>

namespace tradebots {
namespace strategy {

// Builds a fresh strategy instance (with empty private state) per bot start.
class StrategyFactory {
public:
    StrategyFactory() = default;
    StrategyFactory(const TrendFollowStrategyConfig& trend_follow,
                    const CrossoverStrategyConfig& crossover,
                    const ThresholdOscillatorStrategyConfig& oscillator);

    // Ids are matched case-insensitively after trimming, and legacy names
    // map to their current strategy. nullptr for an unknown id.
    std::unique_ptr<IStrategy> create(const std::string& strategy_id, double stoploss_amount) const;

    bool isKnown(const std::string& strategy_id) const;
    std::vector<std::string> knownIds() const;

    static std::string canonicalId(const std::string& strategy_id);

private:
    TrendFollowStrategyConfig trend_follow_config_;
    CrossoverStrategyConfig crossover_config_;
    ThresholdOscillatorStrategyConfig oscillator_config_;
};

} // namespace strategy
} // namespace tradebots
