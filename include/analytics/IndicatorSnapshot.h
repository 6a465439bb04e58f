#pragma once

#include "common/Types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradebots {
namespace analytics {

// indicator id -> latest value, absent while warming up
using IndicatorValues = std::map<std::string, std::optional<double>>;

// Stateless: every call recomputes from the given prices.
// Supported ids: sma_N, ema_N, rsi_N, macd, macd_signal, macd_hist (12/26/9).
// Unknown ids are reported absent.
class IndicatorSnapshot {
public:
    static IndicatorValues compute(const std::vector<double>& prices,
                                   const std::vector<std::string>& requested);

    static IndicatorValues compute(const std::vector<PricePoint>& points,
                                   const std::vector<std::string>& requested);

    static bool isKnownIndicator(const std::string& id);

    static std::vector<double> extractPrices(const std::vector<PricePoint>& points);
};

} // namespace analytics
} // namespace tradebots
