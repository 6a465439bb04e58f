#include "strategy/StrategyFactory.h"
#include "strategy/TrendFollowStrategy.h"
#include "strategy/CrossoverStrategy.h"
#include "strategy/ThresholdOscillatorStrategy.h"

#include <algorithm>
#include <cctype>

namespace tradebots {
namespace strategy {

namespace {
// Name used by the first bot release
constexpr const char* kLegacyMomentumId = "naive_momentum";
}

StrategyFactory::StrategyFactory(const TrendFollowStrategyConfig& trend_follow,
                                 const CrossoverStrategyConfig& crossover,
                                 const ThresholdOscillatorStrategyConfig& oscillator)
    : trend_follow_config_(trend_follow)
    , crossover_config_(crossover)
    , oscillator_config_(oscillator)
{}

std::unique_ptr<IStrategy> StrategyFactory::create(const std::string& strategy_id,
                                                   double stoploss_amount) const {
    const std::string id = canonicalId(strategy_id);
    if (id == TrendFollowStrategy::kId) {
        return std::make_unique<TrendFollowStrategy>(stoploss_amount, trend_follow_config_);
    }
    if (id == CrossoverStrategy::kId) {
        return std::make_unique<CrossoverStrategy>(stoploss_amount, crossover_config_);
    }
    if (id == ThresholdOscillatorStrategy::kId) {
        return std::make_unique<ThresholdOscillatorStrategy>(stoploss_amount, oscillator_config_);
    }
    return nullptr;
}

bool StrategyFactory::isKnown(const std::string& strategy_id) const {
    const std::string canonical = canonicalId(strategy_id);
    for (const auto& id : knownIds()) {
        if (id == canonical) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> StrategyFactory::knownIds() const {
    return {
        TrendFollowStrategy::kId,
        CrossoverStrategy::kId,
        ThresholdOscillatorStrategy::kId
    };
}

std::string StrategyFactory::canonicalId(const std::string& strategy_id) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(strategy_id.begin(), strategy_id.end(), not_space);
    auto last = std::find_if(strategy_id.rbegin(), strategy_id.rend(), not_space).base();

    std::string id = first < last ? std::string(first, last) : std::string();
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (id == kLegacyMomentumId) {
        return TrendFollowStrategy::kId;
    }
    return id;
}

} // namespace strategy
} // namespace tradebots
