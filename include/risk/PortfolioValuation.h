#pragma once

#include "common/Types.h"
#include "market/PriceHistoryStore.h"
#include <vector>

namespace tradebots {
namespace risk {

struct Valuation {
    double total_usd = 0.0;
    std::vector<Asset> unpriced_assets;     // held but no price yet, left out of the total

    bool complete() const { return unpriced_assets.empty(); }
};

class PortfolioValuation {
public:
    // Sum of balance x latest USD price. Zero and negative balances are ignored.
    static Valuation valueUsd(const Balances& balances, const market::PriceHistoryStore& prices);
};

// Trips once the portfolio has lost at least `threshold` USD
// against the value captured when the bot started.
class StoplossGuard {
public:
    StoplossGuard(double reference_value, double threshold);

    bool isBreached(double current_value) const;
    double loss(double current_value) const { return reference_value_ - current_value; }

    double referenceValue() const { return reference_value_; }
    double threshold() const { return threshold_; }

private:
    double reference_value_;
    double threshold_;
};

} // namespace risk
} // namespace tradebots
