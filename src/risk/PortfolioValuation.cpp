#include "risk/PortfolioValuation.h"
#include "common/Logger.h"
#include <cmath>

namespace tradebots {
namespace risk {

Valuation PortfolioValuation::valueUsd(const Balances& balances,
                                       const market::PriceHistoryStore& prices) {
    Valuation result;
    for (const auto& [asset, amount] : balances) {
        if (amount <= 0.0) {
            continue;
        }
        auto usd = prices.latestUsdPrice(asset);
        if (!usd) {
            LOG_WARN("No USD price for {}, excluded from valuation", asset);
            result.unpriced_assets.push_back(asset);
            continue;
        }
        result.total_usd += amount * (*usd);
    }
    return result;
}

StoplossGuard::StoplossGuard(double reference_value, double threshold)
    : reference_value_(reference_value)
    , threshold_(threshold)
{}

// A value that cannot be computed counts as a breach
bool StoplossGuard::isBreached(double current_value) const {
    if (!std::isfinite(current_value)) {
        return true;
    }
    return loss(current_value) >= threshold_;
}

} // namespace risk
} // namespace tradebots
