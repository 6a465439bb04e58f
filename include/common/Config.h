#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace tradebots {

class Config {
public:
    static Config& getInstance();

    // Missing or unreadable files keep the defaults
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::LedgerConfig getLedgerConfig() const { return ledger_config_; }
    engine::FeedConfig getFeedConfig() const { return feed_config_; }

    std::vector<std::string> getUsers() const { return users_; }
    std::vector<engine::BotLaunchConfig> getBots() const { return bots_; }

    // Strategy Configs
    strategy::TrendFollowStrategyConfig getTrendFollowConfig() const { return trend_follow_config_; }
    strategy::CrossoverStrategyConfig getCrossoverConfig() const { return crossover_config_; }
    strategy::ThresholdOscillatorStrategyConfig getThresholdOscillatorConfig() const { return oscillator_config_; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
    engine::LedgerConfig ledger_config_;
    engine::FeedConfig feed_config_;

    std::vector<std::string> users_;
    std::vector<engine::BotLaunchConfig> bots_;

    strategy::TrendFollowStrategyConfig trend_follow_config_;
    strategy::CrossoverStrategyConfig crossover_config_;
    strategy::ThresholdOscillatorStrategyConfig oscillator_config_;
};

} // namespace tradebots
