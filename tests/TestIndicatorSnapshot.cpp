#undef NDEBUG
#include "analytics/IndicatorSnapshot.h"
#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>

using tradebots::analytics::IndicatorSnapshot;
using tradebots::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    std::cout << "[TEST] Starting IndicatorSnapshot Test..." << std::endl;

    // Warm-up values are absent, not zero
    {
        std::vector<double> prices = {1, 2, 3, 4};
        auto values = IndicatorSnapshot::compute(prices, {"sma_5", "rsi_14", "macd"});
        assert(values.size() == 3);
        assert(!values["sma_5"].has_value());
        assert(!values["rsi_14"].has_value());
        assert(!values["macd"].has_value());
    }

    // SMA and EMA latest values
    {
        std::vector<double> prices = {1, 2, 3, 4, 5, 6};
        auto values = IndicatorSnapshot::compute(prices, {"sma_3", "ema_3", "sma_6"});
        assert(near(*values["sma_3"], 5.0));
        assert(near(*values["sma_6"], 3.5));
        // Linear series: EMA lags the price by (period - 1) / 2
        assert(near(*values["ema_3"], 5.0));
    }

    // RSI: constant prices are neutral, rising prices saturate
    {
        std::vector<double> flat(20, 50000.0);
        assert(near(*IndicatorSnapshot::compute(flat, {"rsi_14"})["rsi_14"], 50.0));

        std::vector<double> rising;
        for (int i = 0; i < 20; ++i) rising.push_back(100.0 + i);
        assert(near(*IndicatorSnapshot::compute(rising, {"rsi_14"})["rsi_14"], 100.0));

        std::vector<double> falling;
        for (int i = 0; i < 20; ++i) falling.push_back(100.0 - i);
        assert(near(*IndicatorSnapshot::compute(falling, {"rsi_14"})["rsi_14"], 0.0));

        // First defined value needs period + 1 prices
        std::vector<double> exact(15, 10.0);
        assert(IndicatorSnapshot::compute(exact, {"rsi_14"})["rsi_14"].has_value());
        exact.pop_back();
        assert(!IndicatorSnapshot::compute(exact, {"rsi_14"})["rsi_14"].has_value());
    }

    // MACD lines
    {
        std::vector<double> flat(60, 10.0);
        auto values = IndicatorSnapshot::compute(flat, {"macd", "macd_signal", "macd_hist"});
        assert(near(*values["macd"], 0.0));
        assert(near(*values["macd_signal"], 0.0));
        assert(near(*values["macd_hist"], 0.0));
    }

    // Unknown ids are reported absent
    {
        std::vector<double> prices(30, 1.0);
        auto values = IndicatorSnapshot::compute(prices, {"bollinger", "sma_x", "sma_0"});
        assert(!values["bollinger"].has_value());
        assert(!values["sma_x"].has_value());
        assert(!values["sma_0"].has_value());
        assert(!IndicatorSnapshot::isKnownIndicator("bollinger"));
        assert(IndicatorSnapshot::isKnownIndicator("ema_12"));
        assert(IndicatorSnapshot::isKnownIndicator("macd_hist"));
    }

    // Stateless: same input, same output regardless of call order
    {
        std::vector<double> a = {5, 4, 3, 2, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
        std::vector<double> b(16, 3.0);
        auto first = IndicatorSnapshot::compute(a, {"rsi_14", "sma_5"});
        IndicatorSnapshot::compute(b, {"rsi_14", "sma_5"});
        auto second = IndicatorSnapshot::compute(a, {"rsi_14", "sma_5"});
        assert(first == second);
    }

    // Each indicator becomes defined exactly at its warm-up length
    {
        auto definedAt = [](size_t n, const std::string& id) {
            std::vector<double> prices;
            for (size_t i = 0; i < n; ++i) prices.push_back(100.0 + std::sin(static_cast<double>(i)));
            return IndicatorSnapshot::compute(prices, {id})[id].has_value();
        };
        assert(definedAt(TechnicalIndicators::smaWarmup(20), "sma_20"));
        assert(!definedAt(TechnicalIndicators::smaWarmup(20) - 1, "sma_20"));
        assert(definedAt(TechnicalIndicators::emaWarmup(12), "ema_12"));
        assert(!definedAt(TechnicalIndicators::emaWarmup(12) - 1, "ema_12"));
        assert(definedAt(TechnicalIndicators::rsiWarmup(14), "rsi_14"));
        assert(!definedAt(TechnicalIndicators::rsiWarmup(14) - 1, "rsi_14"));
        assert(definedAt(TechnicalIndicators::macdSignalWarmup(26, 9), "macd_signal"));
        assert(!definedAt(TechnicalIndicators::macdSignalWarmup(26, 9) - 1, "macd_signal"));
        assert(definedAt(26, "macd") && !definedAt(25, "macd"));
    }

    // SMA series alignment
    {
        auto sma = TechnicalIndicators::calculateSMA({1, 2, 3, 4}, 2);
        assert(sma.size() == 4);
        assert(std::isnan(sma[0]));
        assert(near(sma[1], 1.5));
        assert(near(sma[3], 3.5));
    }

    std::cout << "[TEST] IndicatorSnapshot Test PASSED!" << std::endl;
    return 0;
}
