#undef NDEBUG
#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace tradebots;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Defaults before anything is loaded
    assert(config.getEngineConfig().cycle_interval_ms == 60000);
    assert(config.getEngineConfig().window_capacity == 17280);
    assert(config.getEngineConfig().context_window == 720);
    assert(std::abs(config.getLedgerConfig().starting_cash - 10000.0) < 1e-9);
    assert(config.getTrendFollowConfig().lookback == 3);
    assert(config.getThresholdOscillatorConfig().oscillator == "rsi_14");

    // 2. Missing file keeps defaults
    assert(!config.load("/nonexistent/tradebots/config.json"));
    assert(config.getEngineConfig().cycle_interval_ms == 60000);

    // 3. Load a temporary file
    const auto path = std::filesystem::temp_directory_path() / "tradebots_test_config.json";
    {
        std::ofstream out(path);
        out << R"({
            "logging": { "level": "debug", "dir": "test_logs" },
            "market": { "window_capacity": 500, "context_window": 60 },
            "scheduler": { "cycle_interval_ms": 1000, "reject_manual_trades_while_bot_active": false },
            "ledger": { "starting_cash": 2500.0, "min_deposit": 1.0, "journal_path": "" },
            "feed": { "interval_ms": 250, "assets": { "BTC": 50000.0, "ETH": 3000.0 } },
            "strategies": {
                "crossover": { "fast_indicator": "ema_12", "slow_indicator": "ema_26" },
                "threshold_oscillator": { "low": 25.0, "high": 75.0 }
            },
            "users": [" alice ", "bob"],
            "bots": [
                { "user": "alice", "strategy": "Naive_Momentum", "base": "BTC", "quote": "USD", "stoploss": 500.0 }
            ]
        })";
    }
    assert(config.load(path.string()));

    std::cout << "Log level: " << config.getLogLevel() << std::endl;
    assert(config.getLogLevel() == "debug");
    assert(config.getLogDir() == "test_logs");

    auto engine_config = config.getEngineConfig();
    assert(engine_config.window_capacity == 500);
    assert(engine_config.context_window == 60);
    assert(engine_config.cycle_interval_ms == 1000);
    assert(!engine_config.reject_manual_trades_while_bot_active);

    auto ledger_config = config.getLedgerConfig();
    assert(std::abs(ledger_config.starting_cash - 2500.0) < 1e-9);
    assert(std::abs(ledger_config.min_deposit - 1.0) < 1e-9);
    assert(std::abs(ledger_config.max_deposit - 100000.0) < 1e-9);
    assert(ledger_config.journal_path.empty());

    auto feed_config = config.getFeedConfig();
    assert(feed_config.interval_ms == 250);
    assert(feed_config.assets.size() == 2);
    assert(feed_config.assets.at("ETH") == 3000.0);

    // 4. Strategy configs: given values override, the rest keep defaults
    auto crossover = config.getCrossoverConfig();
    assert(crossover.fast_indicator == "ema_12");
    assert(crossover.slow_indicator == "ema_26");
    assert(std::abs(crossover.step_pct_of_stoploss - 0.01) < 1e-12);

    auto oscillator = config.getThresholdOscillatorConfig();
    assert(oscillator.low == 25.0 && oscillator.high == 75.0);
    assert(oscillator.cooldown_cycles == 3);

    // 5. Users and bots, names normalized
    auto users = config.getUsers();
    assert(users.size() == 2 && users[0] == "alice");
    auto bots = config.getBots();
    assert(bots.size() == 1);
    assert(bots[0].strategy == "trend_follow");
    assert(bots[0].stoploss == 500.0);

    // 6. Out-of-range numbers fall back to defaults instead of breaking the engine
    config.loadFromJson(nlohmann::json::parse(R"({
        "market": { "window_capacity": 0, "context_window": 50 },
        "scheduler": { "cycle_interval_ms": -5 },
        "feed": { "interval_ms": 0, "backfill_points": 0 }
    })"));
    engine_config = config.getEngineConfig();
    assert(engine_config.window_capacity == 17280);
    assert(engine_config.context_window == 50);
    assert(engine_config.cycle_interval_ms == 60000);
    feed_config = config.getFeedConfig();
    assert(feed_config.interval_ms == 5000);
    assert(feed_config.backfill_points == 0);

    config.loadFromJson(nlohmann::json::parse(R"({
        "market": { "window_capacity": 100, "context_window": 500 },
        "scheduler": { "cycle_interval_ms": "fast" },
        "feed": { "backfill_points": -1 }
    })"));
    engine_config = config.getEngineConfig();
    assert(engine_config.window_capacity == 100);
    assert(engine_config.context_window == 100);
    assert(engine_config.cycle_interval_ms == 60000);
    assert(config.getFeedConfig().backfill_points == 720);

    std::filesystem::remove(path);
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
