#include "common/Config.h"
#include "common/PathUtils.h"
#include "strategy/StrategyFactory.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradebots {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

// Numeric setting that must be positive (or zero when allowed); anything
// else is reported and replaced by the default.
template <typename T>
T boundedValue(const nlohmann::json& section, const char* key, T fallback, bool allow_zero = false) {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto& value = section[key];
    const bool numeric = value.is_number();
    const double number = numeric ? value.get<double>() : 0.0;
    if (!numeric || number < 0.0 || (number == 0.0 && !allow_zero)) {
        std::cerr << "Warning: " << key << " = " << value.dump()
                  << " is out of range, using " << fallback << std::endl;
        return fallback;
    }
    return value.get<T>();
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return false;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: cycle=" << engine_config_.cycle_interval_ms
                  << "ms, window=" << engine_config_.window_capacity << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", "info");
        log_dir_ = l.value("dir", "logs");
    }

    if (j.contains("market")) {
        auto& m = j["market"];
        engine_config_.window_capacity = boundedValue(m, "window_capacity", static_cast<size_t>(17280));
        engine_config_.context_window = boundedValue(m, "context_window", static_cast<size_t>(720));
        if (engine_config_.context_window > engine_config_.window_capacity) {
            std::cerr << "Warning: context_window exceeds window_capacity, clamped to "
                      << engine_config_.window_capacity << std::endl;
            engine_config_.context_window = engine_config_.window_capacity;
        }
    }

    if (j.contains("scheduler")) {
        auto& s = j["scheduler"];
        engine_config_.cycle_interval_ms = boundedValue(s, "cycle_interval_ms", 60000);
        engine_config_.reject_manual_trades_while_bot_active =
            s.value("reject_manual_trades_while_bot_active", true);
    }

    if (j.contains("ledger")) {
        auto& l = j["ledger"];
        ledger_config_.starting_cash = l.value("starting_cash", 10000.0);
        ledger_config_.min_deposit = l.value("min_deposit", 10.0);
        ledger_config_.max_deposit = l.value("max_deposit", 100000.0);
        ledger_config_.journal_path = l.value("journal_path", "data/transactions.jsonl");
    }

    if (j.contains("feed")) {
        auto& f = j["feed"];
        feed_config_.interval_ms = boundedValue(f, "interval_ms", 5000);
        feed_config_.backfill_points = boundedValue(f, "backfill_points", 720, true);
        feed_config_.csv_path = f.value("csv_path", "");
        if (f.contains("assets")) {
            feed_config_.assets = f["assets"].get<std::map<std::string, double>>();
        }
    }

    if (j.contains("users")) {
        users_ = j["users"].get<std::vector<std::string>>();
        for (auto& user : users_) {
            user = trimCopy(user);
        }
    }

    if (j.contains("bots")) {
        bots_.clear();
        for (const auto& b : j["bots"]) {
            engine::BotLaunchConfig bot;
            bot.user = trimCopy(b.value("user", ""));
            bot.strategy = strategy::StrategyFactory::canonicalId(b.value("strategy", ""));
            bot.base = b.value("base", "BTC");
            bot.quote = b.value("quote", "USD");
            bot.stoploss = b.value("stoploss", 0.0);
            bots_.push_back(bot);
        }
    }

    if (j.contains("strategies") && j["strategies"].contains("trend_follow")) {
        auto& s = j["strategies"]["trend_follow"];
        trend_follow_config_.lookback = s.value("lookback", 3);
        trend_follow_config_.cooldown_cycles = s.value("cooldown_cycles", 3);
        trend_follow_config_.history_size = s.value("history_size", 10);
        trend_follow_config_.step_pct_of_stoploss = s.value("step_pct_of_stoploss", 0.01);
    }

    if (j.contains("strategies") && j["strategies"].contains("crossover")) {
        auto& s = j["strategies"]["crossover"];
        crossover_config_.fast_indicator = s.value("fast_indicator", "sma_20");
        crossover_config_.slow_indicator = s.value("slow_indicator", "sma_50");
        crossover_config_.step_pct_of_stoploss = s.value("step_pct_of_stoploss", 0.01);
    }

    if (j.contains("strategies") && j["strategies"].contains("threshold_oscillator")) {
        auto& s = j["strategies"]["threshold_oscillator"];
        oscillator_config_.oscillator = s.value("oscillator", "rsi_14");
        oscillator_config_.low = s.value("low", 30.0);
        oscillator_config_.high = s.value("high", 70.0);
        oscillator_config_.cooldown_cycles = s.value("cooldown_cycles", 3);
        oscillator_config_.step_pct_of_stoploss = s.value("step_pct_of_stoploss", 0.01);
    }
}

} // namespace tradebots
