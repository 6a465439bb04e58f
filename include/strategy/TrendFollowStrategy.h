#pragma once

#include "strategy/StrategyBase.h"
#include "strategy/StrategyConfig.h"

namespace tradebots {
namespace strategy {

// Buys after `lookback` consecutive rising cycle prices, sells after as many
// falling ones, then sits out `cooldown_cycles` cycles.
class TrendFollowStrategy : public StrategyBase {
public:
    static constexpr const char* kId = "trend_follow";

    TrendFollowStrategy(double stoploss_amount, const TrendFollowStrategyConfig& config);

    StrategyInfo getInfo() const override;
    Decision decide(const BotContext& ctx) override;

    int cooldownRemaining() const { return cooldown_remaining_; }

private:
    bool isUptrend() const;
    bool isDowntrend() const;

    TrendFollowStrategyConfig config_;
    PriceHistory price_history_;
    int cooldown_remaining_;
};

} // namespace strategy
} // namespace tradebots
