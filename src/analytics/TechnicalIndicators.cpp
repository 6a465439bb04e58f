#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <limits>

namespace tradebots {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    // Rolling sum over the window
    double sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            result[i] = sum / period;
        }
    }
    return result;
}

std::vector<double> TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    const double k = 2.0 / (period + 1.0);

    double seed = 0.0;
    for (int i = 0; i < period; ++i) {
        seed += prices[i];
    }
    result[period - 1] = seed / period;

    // EMA(t) = price(t) * k + EMA(t-1) * (1 - k)
    for (size_t i = period; i < prices.size(); ++i) {
        result[i] = prices[i] * k + result[i - 1] * (1.0 - k);
    }
    return result;
}

std::vector<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    std::vector<double> result(prices.size(), kNaN);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return result;
    }

    auto rsiFrom = [](double avg_gain, double avg_loss) {
        if (avg_loss < 1e-12) {
            return avg_gain < 1e-12 ? 50.0 : 100.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // Simple average over the first period
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;
    result[period] = rsiFrom(avg_gain, avg_loss);

    // Wilder's smoothing for the rest
    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain = (change > 0) ? change : 0.0;
        const double loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + loss) / period;
        result[i] = rsiFrom(avg_gain, avg_loss);
    }
    return result;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    result.macd.assign(prices.size(), kNaN);
    result.signal.assign(prices.size(), kNaN);
    result.histogram.assign(prices.size(), kNaN);

    if (fast <= 0 || slow <= 0 || signal_period <= 0 || prices.size() < static_cast<size_t>(slow)) {
        return result;
    }

    const auto fast_ema = calculateEMA(prices, fast);
    const auto slow_ema = calculateEMA(prices, slow);

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!std::isnan(fast_ema[i]) && !std::isnan(slow_ema[i])) {
            result.macd[i] = fast_ema[i] - slow_ema[i];
        }
    }

    result.signal = emaOverDefined(result.macd, signal_period);
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!std::isnan(result.signal[i])) {
            result.histogram[i] = result.macd[i] - result.signal[i];
        }
    }
    return result;
}

// EMA over the defined (non-NaN) tail of a series, keeping alignment
std::vector<double> TechnicalIndicators::emaOverDefined(const std::vector<double>& series, int period) {
    std::vector<double> result(series.size(), kNaN);

    size_t first = 0;
    while (first < series.size() && std::isnan(series[first])) {
        ++first;
    }
    if (first >= series.size()) {
        return result;
    }

    const std::vector<double> tail(series.begin() + first, series.end());
    const auto tail_ema = calculateEMA(tail, period);
    for (size_t i = 0; i < tail_ema.size(); ++i) {
        result[first + i] = tail_ema[i];
    }
    return result;
}

} // namespace analytics
} // namespace tradebots
