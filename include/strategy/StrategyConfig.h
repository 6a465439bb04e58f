#pragma once

#include <string>

namespace tradebots {
namespace strategy {

struct TrendFollowStrategyConfig {
    int lookback = 3;                   // consecutive samples compared
    int cooldown_cycles = 3;            // cycles ignored after a trade
    int history_size = 10;
    double step_pct_of_stoploss = 0.01; // 1% of stoploss per trade
};

struct CrossoverStrategyConfig {
    std::string fast_indicator = "sma_20";
    std::string slow_indicator = "sma_50";
    double step_pct_of_stoploss = 0.01;
};

struct ThresholdOscillatorStrategyConfig {
    std::string oscillator = "rsi_14";
    double low = 30.0;      // oversold -> buy
    double high = 70.0;     // overbought -> sell
    int cooldown_cycles = 3;
    double step_pct_of_stoploss = 0.01;
};

} // namespace strategy
} // namespace tradebots
