#pragma once

#include "common/Types.h"
#include "analytics/IndicatorSnapshot.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tradebots {
namespace strategy {

enum class DecisionType {
    HOLD,
    BUY,
    SELL
};

// Amounts are always in the quote asset ("buy $100 worth of BTC").
// The scheduler converts to base units at the current price.
struct Decision {
    DecisionType type;
    double quote_amount;

    Decision() : type(DecisionType::HOLD), quote_amount(0.0) {}

    static Decision hold() { return Decision(); }
    static Decision buy(double quote_amount) { return Decision(DecisionType::BUY, quote_amount); }
    static Decision sell(double quote_amount) { return Decision(DecisionType::SELL, quote_amount); }

    bool isHold() const { return type == DecisionType::HOLD; }

    bool operator==(const Decision& other) const {
        return type == other.type && quote_amount == other.quote_amount;
    }
    bool operator!=(const Decision& other) const { return !(*this == other); }

private:
    Decision(DecisionType t, double amount) : type(t), quote_amount(amount) {}
};

inline const char* toString(DecisionType type) {
    switch (type) {
        case DecisionType::HOLD: return "HOLD";
        case DecisionType::BUY: return "BUY";
        case DecisionType::SELL: return "SELL";
    }
    return "HOLD";
}

// Built fresh every cycle and handed over by const reference.
// Strategies must not keep references into it after decide() returns.
struct BotContext {
    std::vector<PricePoint> price_window;   // raw samples of the base asset, oldest first
    double base_balance;
    double quote_balance;
    double current_price;                   // base priced in quote
    TradingPair pair;
    uint64_t cycle;                         // 1 for the first cycle
    analytics::IndicatorValues indicators;

    BotContext()
        : base_balance(0)
        , quote_balance(0)
        , current_price(0)
        , cycle(0)
    {}

    std::optional<double> indicator(const std::string& id) const {
        auto it = indicators.find(id);
        if (it == indicators.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

struct StrategyInfo {
    std::string id;             // e.g. "trend_follow"
    std::string name;           // display name
    std::string description;
};

// One trading style. Owns its private state for the lifetime of the bot;
// only the scheduler calls decide().
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    virtual Decision decide(const BotContext& ctx) = 0;

    // Indicators the scheduler must put into the context
    virtual std::vector<std::string> requiredIndicators() const { return {}; }

    // Outcome of this strategy's own non-hold decisions
    virtual void onDecisionApplied(const Decision&, const Transaction&) {}

    struct Statistics {
        int total_decisions;
        int buy_decisions;
        int sell_decisions;
        int applied_trades;
        std::string last_action;

        Statistics()
            : total_decisions(0), buy_decisions(0), sell_decisions(0), applied_trades(0)
        {}
    };

    virtual Statistics getStatistics() const = 0;
};

} // namespace strategy
} // namespace tradebots
