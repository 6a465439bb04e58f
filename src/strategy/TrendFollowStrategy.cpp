#include "strategy/TrendFollowStrategy.h"
#include <algorithm>
#include <fmt/format.h>

namespace tradebots {
namespace strategy {

TrendFollowStrategy::TrendFollowStrategy(double stoploss_amount, const TrendFollowStrategyConfig& config)
    : StrategyBase(stoploss_amount, config.step_pct_of_stoploss)
    , config_(config)
    , price_history_(static_cast<size_t>(std::max(config.history_size, std::max(config.lookback, 2))))
    , cooldown_remaining_(0)
{
    config_.lookback = std::max(config_.lookback, 2);
}

StrategyInfo TrendFollowStrategy::getInfo() const {
    StrategyInfo info;
    info.id = kId;
    info.name = "Trend Follow Bot";
    info.description = "Trades in the direction of consecutive price moves, with a cooldown";
    return info;
}

Decision TrendFollowStrategy::decide(const BotContext& ctx) {
    // One sample per cycle
    price_history_.push(ctx.current_price);

    if (cooldown_remaining_ > 0) {
        cooldown_remaining_--;
        return record(Decision::hold(), fmt::format("cooldown ({})", cooldown_remaining_));
    }

    if (!price_history_.hasAtLeast(static_cast<size_t>(config_.lookback))) {
        return record(Decision::hold(), "warming up");
    }

    if (isUptrend()) {
        cooldown_remaining_ = config_.cooldown_cycles;
        return record(Decision::buy(step_quote_), fmt::format("buy {:.2f}", step_quote_));
    }

    if (isDowntrend()) {
        cooldown_remaining_ = config_.cooldown_cycles;
        return record(Decision::sell(step_quote_), fmt::format("sell {:.2f}", step_quote_));
    }

    return record(Decision::hold(), "no trend");
}

bool TrendFollowStrategy::isUptrend() const {
    const auto recent = price_history_.lastN(static_cast<size_t>(config_.lookback));
    for (size_t i = 1; i < recent.size(); ++i) {
        if (!(recent[i] > recent[i - 1])) {
            return false;
        }
    }
    return true;
}

bool TrendFollowStrategy::isDowntrend() const {
    const auto recent = price_history_.lastN(static_cast<size_t>(config_.lookback));
    for (size_t i = 1; i < recent.size(); ++i) {
        if (!(recent[i] < recent[i - 1])) {
            return false;
        }
    }
    return true;
}

} // namespace strategy
} // namespace tradebots
