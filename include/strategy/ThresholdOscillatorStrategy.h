#pragma once

#include "strategy/StrategyBase.h"
#include "strategy/StrategyConfig.h"

namespace tradebots {
namespace strategy {

// Buys while the oscillator is below `low` (oversold), sells above `high`
// (overbought), then waits `cooldown_cycles` cycles.
class ThresholdOscillatorStrategy : public StrategyBase {
public:
    static constexpr const char* kId = "threshold_oscillator";

    ThresholdOscillatorStrategy(double stoploss_amount, const ThresholdOscillatorStrategyConfig& config);

    StrategyInfo getInfo() const override;
    Decision decide(const BotContext& ctx) override;
    std::vector<std::string> requiredIndicators() const override;

    int cooldownRemaining() const { return cooldown_remaining_; }

private:
    ThresholdOscillatorStrategyConfig config_;
    int cooldown_remaining_;
};

} // namespace strategy
} // namespace tradebots
