#pragma once

#include <string>
#include <vector>
#include <map>

namespace tradebots {
namespace engine {

// Scheduler settings
struct EngineConfig {
    int cycle_interval_ms;
    size_t window_capacity;     // points kept per asset (24h of 5s samples)
    size_t context_window;      // points handed to a strategy (1h of 5s samples)

    // Manual trades for a user fail while one of their bots is running
    bool reject_manual_trades_while_bot_active = true;

    EngineConfig()
        : cycle_interval_ms(60000)
        , window_capacity(17280)
        , context_window(720)
    {}
};

struct LedgerConfig {
    double starting_cash = 10000.0;
    double min_deposit = 10.0;
    double max_deposit = 100000.0;
    std::string journal_path = "data/transactions.jsonl";
};

struct FeedConfig {
    int interval_ms = 5000;
    int backfill_points = 720;
    std::string csv_path;
    std::map<std::string, double> assets;   // symbol -> reference USD price
};

// A bot started by the executable at boot
struct BotLaunchConfig {
    std::string user;
    std::string strategy;
    std::string base;
    std::string quote;
    double stoploss = 0.0;
};

} // namespace engine
} // namespace tradebots
