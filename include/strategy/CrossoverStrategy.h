#pragma once

#include "strategy/StrategyBase.h"
#include "strategy/StrategyConfig.h"

namespace tradebots {
namespace strategy {

// Fast/slow moving average crossover. Only a flip of the strict side
// (above <-> below) counts as a crossing; samples where fast == slow keep
// the last side, so touching the slow line never re-triggers an entry.
class CrossoverStrategy : public StrategyBase {
public:
    static constexpr const char* kId = "crossover";

    CrossoverStrategy(double stoploss_amount, const CrossoverStrategyConfig& config);

    StrategyInfo getInfo() const override;
    Decision decide(const BotContext& ctx) override;
    std::vector<std::string> requiredIndicators() const override;

private:
    enum class Side { UNKNOWN, ABOVE, BELOW };

    CrossoverStrategyConfig config_;
    Side last_side_ = Side::UNKNOWN;
};

} // namespace strategy
} // namespace tradebots
