#undef NDEBUG
#include "strategy/CrossoverStrategy.h"
#include "strategy/StrategyFactory.h"
#include "strategy/ThresholdOscillatorStrategy.h"
#include "strategy/TrendFollowStrategy.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace tradebots;
using namespace tradebots::strategy;

namespace {
BotContext makeContext(uint64_t cycle, double price) {
    BotContext ctx;
    ctx.pair = TradingPair{"BTC", "USD"};
    ctx.base_balance = 0.0;
    ctx.quote_balance = 10000.0;
    ctx.current_price = price;
    ctx.cycle = cycle;
    ctx.price_window.push_back(PricePoint(static_cast<long long>(cycle) * 5000, "BTC", price));
    return ctx;
}

void testTrendFollowCooldown() {
    TrendFollowStrategyConfig config;
    config.lookback = 3;
    config.cooldown_cycles = 3;
    TrendFollowStrategy strategy(500.0, config);
    assert(std::abs(strategy.stepQuote() - 5.0) < 1e-12);

    // Rising prices: buy on the third sample, then three held cycles
    std::vector<double> prices = {100, 101, 102, 103, 104, 105, 106};
    std::vector<Decision> decisions;
    uint64_t cycle = 0;
    for (double p : prices) {
        decisions.push_back(strategy.decide(makeContext(++cycle, p)));
    }

    assert(decisions[0].isHold());
    assert(decisions[1].isHold());
    assert(decisions[2] == Decision::buy(5.0));
    assert(decisions[3].isHold());
    assert(decisions[4].isHold());
    assert(decisions[5].isHold());
    assert(decisions[6] == Decision::buy(5.0));

    // Falling prices after the cooldown
    TrendFollowStrategy seller(1000.0, config);
    assert(seller.decide(makeContext(1, 100)).isHold());
    assert(seller.decide(makeContext(2, 99)).isHold());
    assert(seller.decide(makeContext(3, 98)) == Decision::sell(10.0));
    assert(seller.cooldownRemaining() == 3);

    // Flat prices never trade
    TrendFollowStrategy flat(500.0, config);
    for (uint64_t c = 1; c <= 10; ++c) {
        assert(flat.decide(makeContext(c, 100)).isHold());
    }

    auto stats = strategy.getStatistics();
    assert(stats.total_decisions == 7);
    assert(stats.buy_decisions == 2);
    assert(stats.sell_decisions == 0);

    std::cout << "[TEST] TrendFollow cooldown PASSED" << std::endl;
}

void testCrossoverSingleBuy() {
    CrossoverStrategyConfig config;
    config.fast_indicator = "sma_20";
    config.slow_indicator = "sma_50";
    CrossoverStrategy strategy(1000.0, config);

    auto required = strategy.requiredIndicators();
    assert(required.size() == 2);

    // fast below, below, crosses above, stays above
    const double fast[] = {95, 98, 101, 104, 108, 110};
    const double slow = 100.0;
    int buys = 0;
    int buy_cycle = -1;
    for (int i = 0; i < 6; ++i) {
        BotContext ctx = makeContext(static_cast<uint64_t>(i + 1), 50000.0);
        ctx.indicators["sma_20"] = fast[i];
        ctx.indicators["sma_50"] = slow;
        Decision d = strategy.decide(ctx);
        assert(d.type != DecisionType::SELL);
        if (d.type == DecisionType::BUY) {
            buys++;
            buy_cycle = i + 1;
            assert(std::abs(d.quote_amount - 10.0) < 1e-12);
        }
    }
    assert(buys == 1);
    assert(buy_cycle == 3);

    // Cross back below: exactly one sell
    int sells = 0;
    const double fast_down[] = {99, 97, 96};
    for (int i = 0; i < 3; ++i) {
        BotContext ctx = makeContext(static_cast<uint64_t>(7 + i), 50000.0);
        ctx.indicators["sma_20"] = fast_down[i];
        ctx.indicators["sma_50"] = slow;
        if (strategy.decide(ctx).type == DecisionType::SELL) sells++;
    }
    assert(sells == 1);

    // Warm-up: absent values never trade, and the first defined pair is only a baseline
    CrossoverStrategy fresh(1000.0, config);
    BotContext warm = makeContext(1, 50000.0);
    warm.indicators["sma_20"] = std::nullopt;
    warm.indicators["sma_50"] = std::nullopt;
    assert(fresh.decide(warm).isHold());
    BotContext first = makeContext(2, 50000.0);
    first.indicators["sma_20"] = 105.0;
    first.indicators["sma_50"] = 100.0;
    assert(fresh.decide(first).isHold());

    // Touching the slow line and rising again is not a second cross
    CrossoverStrategy toucher(1000.0, config);
    const double touch[] = {9, 11, 10, 11, 12};
    std::vector<Decision> touch_decisions;
    for (int i = 0; i < 5; ++i) {
        BotContext ctx = makeContext(static_cast<uint64_t>(i + 1), 50000.0);
        ctx.indicators["sma_20"] = touch[i];
        ctx.indicators["sma_50"] = 10.0;
        touch_decisions.push_back(toucher.decide(ctx));
    }
    assert(touch_decisions[0].isHold());
    assert(touch_decisions[1].type == DecisionType::BUY);
    assert(touch_decisions[2].isHold());
    assert(touch_decisions[3].isHold());
    assert(touch_decisions[4].isHold());

    // Touch from above then falling is a single sell
    BotContext down = makeContext(6, 50000.0);
    down.indicators["sma_20"] = 10.0;
    down.indicators["sma_50"] = 10.0;
    assert(toucher.decide(down).isHold());
    down.indicators["sma_20"] = 9.0;
    assert(toucher.decide(down).type == DecisionType::SELL);
    down.indicators["sma_20"] = 8.0;
    assert(toucher.decide(down).isHold());

    std::cout << "[TEST] Crossover single buy PASSED" << std::endl;
}

void testThresholdOscillatorScenario() {
    // 10,000 USD, 0 BTC, price constant at 50,000; oscillator 40, 35, 25
    ThresholdOscillatorStrategyConfig config;
    config.oscillator = "rsi_14";
    config.low = 30.0;
    config.high = 70.0;
    config.cooldown_cycles = 3;
    ThresholdOscillatorStrategy strategy(500.0, config);

    const double oscillator[] = {40.0, 35.0, 25.0};
    std::vector<Decision> decisions;
    for (int i = 0; i < 3; ++i) {
        BotContext ctx = makeContext(static_cast<uint64_t>(i + 1), 50000.0);
        ctx.indicators["rsi_14"] = oscillator[i];
        decisions.push_back(strategy.decide(ctx));
    }
    assert(decisions[0].isHold());
    assert(decisions[1].isHold());
    assert(decisions[2] == Decision::buy(strategy.stepQuote()));
    assert(strategy.cooldownRemaining() == 3);

    // Still oversold but cooling down
    BotContext ctx = makeContext(4, 50000.0);
    ctx.indicators["rsi_14"] = 20.0;
    assert(strategy.decide(ctx).isHold());

    // Overbought sells
    ThresholdOscillatorStrategy seller(500.0, config);
    BotContext hot = makeContext(1, 50000.0);
    hot.indicators["rsi_14"] = 85.0;
    assert(seller.decide(hot) == Decision::sell(5.0));

    // Missing oscillator holds
    ThresholdOscillatorStrategy idle(500.0, config);
    assert(idle.decide(makeContext(1, 50000.0)).isHold());

    std::cout << "[TEST] ThresholdOscillator scenario PASSED" << std::endl;
}

void testFactory() {
    StrategyFactory factory;
    assert(factory.knownIds().size() == 3);
    assert(factory.isKnown("trend_follow"));
    assert(factory.isKnown("crossover"));
    assert(factory.isKnown("threshold_oscillator"));
    assert(!factory.isKnown("martingale"));
    assert(factory.create("martingale", 100.0) == nullptr);

    auto a = factory.create("trend_follow", 100.0);
    auto b = factory.create("trend_follow", 100.0);
    assert(a && b && a.get() != b.get());
    assert(a->getInfo().id == "trend_follow");
    assert(factory.create("crossover", 100.0)->requiredIndicators().size() == 2);

    // Legacy and differently-cased ids resolve to the current strategies
    assert(factory.isKnown("naive_momentum"));
    assert(factory.isKnown("Naive_Momentum"));
    assert(factory.isKnown(" Crossover "));
    auto legacy = factory.create("naive_momentum", 100.0);
    assert(legacy && legacy->getInfo().id == "trend_follow");
    assert(StrategyFactory::canonicalId("  THRESHOLD_Oscillator") == "threshold_oscillator");
    assert(StrategyFactory::canonicalId("   ").empty());
    assert(!factory.isKnown(""));

    std::cout << "[TEST] StrategyFactory PASSED" << std::endl;
}
}

int main() {
    std::cout << "[TEST] Starting Strategy Test..." << std::endl;
    testTrendFollowCooldown();
    testCrossoverSingleBuy();
    testThresholdOscillatorScenario();
    testFactory();
    std::cout << "[TEST] Strategy Test PASSED!" << std::endl;
    return 0;
}
