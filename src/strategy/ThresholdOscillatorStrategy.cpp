#include "strategy/ThresholdOscillatorStrategy.h"
#include <fmt/format.h>

namespace tradebots {
namespace strategy {

ThresholdOscillatorStrategy::ThresholdOscillatorStrategy(
    double stoploss_amount,
    const ThresholdOscillatorStrategyConfig& config
)
    : StrategyBase(stoploss_amount, config.step_pct_of_stoploss)
    , config_(config)
    , cooldown_remaining_(0)
{}

StrategyInfo ThresholdOscillatorStrategy::getInfo() const {
    StrategyInfo info;
    info.id = kId;
    info.name = "Threshold Oscillator Bot";
    info.description = fmt::format("Buys when {} < {:.0f}, sells when {} > {:.0f}",
                                   config_.oscillator, config_.low,
                                   config_.oscillator, config_.high);
    return info;
}

std::vector<std::string> ThresholdOscillatorStrategy::requiredIndicators() const {
    return {config_.oscillator};
}

Decision ThresholdOscillatorStrategy::decide(const BotContext& ctx) {
    if (cooldown_remaining_ > 0) {
        cooldown_remaining_--;
        return record(Decision::hold(), fmt::format("cooldown ({})", cooldown_remaining_));
    }

    const auto value = ctx.indicator(config_.oscillator);
    if (!value) {
        return record(Decision::hold(), "warming up");
    }

    if (*value < config_.low) {
        cooldown_remaining_ = config_.cooldown_cycles;
        return record(Decision::buy(step_quote_), fmt::format("oversold {:.1f}", *value));
    }
    if (*value > config_.high) {
        cooldown_remaining_ = config_.cooldown_cycles;
        return record(Decision::sell(step_quote_), fmt::format("overbought {:.1f}", *value));
    }

    return record(Decision::hold(), fmt::format("neutral {:.1f}", *value));
}

} // namespace strategy
} // namespace tradebots
