#pragma once

#include "strategy/IStrategy.h"
#include <deque>
#include <string>

namespace tradebots {
namespace strategy {

// Bounded history of values a strategy chooses to remember
class PriceHistory {
public:
    explicit PriceHistory(size_t max_size) : max_size_(max_size) {}

    void push(double value) {
        values_.push_back(value);
        while (values_.size() > max_size_) {
            values_.pop_front();
        }
    }

    // Most recent n values, oldest first (fewer if not enough data)
    std::vector<double> lastN(size_t n) const {
        const size_t start = values_.size() > n ? values_.size() - n : 0;
        return std::vector<double>(values_.begin() + start, values_.end());
    }

    bool hasAtLeast(size_t n) const { return values_.size() >= n; }
    size_t size() const { return values_.size(); }

private:
    std::deque<double> values_;
    size_t max_size_;
};

// Statistics bookkeeping shared by the built-in strategies
class StrategyBase : public IStrategy {
public:
    explicit StrategyBase(double stoploss_amount, double step_pct_of_stoploss)
        : step_quote_(stoploss_amount * step_pct_of_stoploss)
    {}

    Statistics getStatistics() const override { return stats_; }

    void onDecisionApplied(const Decision&, const Transaction&) override {
        stats_.applied_trades++;
    }

    double stepQuote() const { return step_quote_; }

protected:
    Decision record(const Decision& decision, const std::string& action) {
        stats_.total_decisions++;
        if (decision.type == DecisionType::BUY) stats_.buy_decisions++;
        if (decision.type == DecisionType::SELL) stats_.sell_decisions++;
        stats_.last_action = action;
        return decision;
    }

    const double step_quote_;
    Statistics stats_;
};

} // namespace strategy
} // namespace tradebots
