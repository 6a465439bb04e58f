#pragma once

#include <cstddef>
#include <vector>

namespace tradebots {
namespace analytics {

// Indicator series aligned with the input: result[i] uses prices[0..i].
// Entries inside the warm-up period are NaN.
class TechnicalIndicators {
public:
    // SMA - first (period - 1) values are NaN
    static std::vector<double> calculateSMA(const std::vector<double>& prices, int period);

    // EMA seeded with the SMA of the first `period` prices, k = 2 / (period + 1)
    static std::vector<double> calculateEMA(const std::vector<double>& prices, int period);

    // RSI with Wilder's smoothing; first `period` values are NaN.
    // Below 30: oversold, above 70: overbought
    static std::vector<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    struct MACDSeries {
        std::vector<double> macd;       // fast EMA - slow EMA
        std::vector<double> signal;     // EMA of macd
        std::vector<double> histogram;  // macd - signal
    };
    static MACDSeries calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    // Samples needed before the last value is defined
    static std::size_t smaWarmup(int period) { return static_cast<std::size_t>(period); }
    static std::size_t emaWarmup(int period) { return static_cast<std::size_t>(period); }
    static std::size_t rsiWarmup(int period) { return static_cast<std::size_t>(period) + 1; }
    static std::size_t macdSignalWarmup(int slow, int signal_period) {
        return static_cast<std::size_t>(slow + signal_period - 1);
    }

private:
    static std::vector<double> emaOverDefined(const std::vector<double>& series, int period);
};

} // namespace analytics
} // namespace tradebots
