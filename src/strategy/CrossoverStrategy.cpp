#include "strategy/CrossoverStrategy.h"
#include <fmt/format.h>

namespace tradebots {
namespace strategy {

CrossoverStrategy::CrossoverStrategy(double stoploss_amount, const CrossoverStrategyConfig& config)
    : StrategyBase(stoploss_amount, config.step_pct_of_stoploss)
    , config_(config)
{}

StrategyInfo CrossoverStrategy::getInfo() const {
    StrategyInfo info;
    info.id = kId;
    info.name = "MA Crossover Bot";
    info.description = fmt::format("Buys when {} crosses above {}, sells on the cross below",
                                   config_.fast_indicator, config_.slow_indicator);
    return info;
}

std::vector<std::string> CrossoverStrategy::requiredIndicators() const {
    return {config_.fast_indicator, config_.slow_indicator};
}

Decision CrossoverStrategy::decide(const BotContext& ctx) {
    const auto fast = ctx.indicator(config_.fast_indicator);
    const auto slow = ctx.indicator(config_.slow_indicator);

    if (!fast || !slow) {
        return record(Decision::hold(), "warming up");
    }
    if (*fast == *slow) {
        return record(Decision::hold(), "touching, side unchanged");
    }

    const Side side = *fast > *slow ? Side::ABOVE : Side::BELOW;
    const Side previous = last_side_;
    last_side_ = side;

    if (previous == Side::UNKNOWN) {
        return record(Decision::hold(), "waiting for previous values");
    }
    if (previous == Side::BELOW && side == Side::ABOVE) {
        return record(Decision::buy(step_quote_),
                      fmt::format("golden cross {:.2f} > {:.2f}", *fast, *slow));
    }
    if (previous == Side::ABOVE && side == Side::BELOW) {
        return record(Decision::sell(step_quote_),
                      fmt::format("death cross {:.2f} < {:.2f}", *fast, *slow));
    }

    return record(Decision::hold(), "no crossing");
}

} // namespace strategy
} // namespace tradebots
