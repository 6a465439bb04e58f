#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/state/TransactionJournalJsonl.h"
#include "engine/BotScheduler.h"
#include "feed/PriceHistoryLoader.h"
#include "feed/SimulatedPriceFeed.h"
#include "market/PriceHistoryStore.h"
#include "portfolio/PortfolioLedger.h"
#include "strategy/StrategyFactory.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tradebots;

namespace {
std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown.store(true);
    }
}

void logStatus(const engine::BotScheduler& scheduler, const portfolio::PortfolioLedger& ledger) {
    for (const auto& user : ledger.users()) {
        const engine::BotStatus status = scheduler.status(user);
        if (status.state == engine::BotState::NONE) {
            continue;
        }
        LOG_INFO("[{}] {} | {} | cycles={} | value={:.2f} USD (start {:.2f})",
                 user,
                 engine::toString(status.state),
                 status.strategy_name,
                 status.cycle_count,
                 scheduler.portfolioValueUsd(user),
                 status.initial_value_usd);
    }
    if (ledger.journalFailures() > 0) {
        LOG_ERROR("{} transactions refused because the journal could not record them",
                  ledger.journalFailures());
    }
}
}

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";
        auto& config = Config::getInstance();
        if (!config.load(config_path)) {
            std::cout << "Continuing with built-in defaults" << std::endl;
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       tradebots execution core\n";
        std::cout << "=============================================\n\n";

        const engine::EngineConfig engine_config = config.getEngineConfig();
        const engine::LedgerConfig ledger_config = config.getLedgerConfig();
        const engine::FeedConfig feed_config = config.getFeedConfig();

        // Ledger, seeded from the journal
        std::shared_ptr<core::TransactionJournalJsonl> journal;
        if (!ledger_config.journal_path.empty()) {
            journal = std::make_shared<core::TransactionJournalJsonl>(
                utils::PathUtils::resolveRelativePath(ledger_config.journal_path));
        }
        portfolio::PortfolioLedger ledger(ledger_config, journal);
        if (journal) {
            std::vector<Transaction> replay;
            for (auto& entry : journal->readFrom(1)) {
                replay.push_back(std::move(entry.transaction));
            }
            ledger.restore(replay);
        }
        for (const auto& user : config.getUsers()) {
            if (!ledger.hasAccount(user)) {
                ledger.openAccount(user, ledger_config.starting_cash);
            }
        }

        // Prices
        market::PriceHistoryStore prices(engine_config.window_capacity);
        feed::SimulatedPriceFeed simulated_feed(prices, feed_config);
        if (!feed_config.csv_path.empty()) {
            const std::string csv_path =
                utils::PathUtils::resolveRelativePath(feed_config.csv_path).string();
            const size_t loaded = feed::PriceHistoryLoader::backfill(
                prices, feed::PriceHistoryLoader::loadCSV(csv_path));
            LOG_INFO("Backfilled {} points from {}", loaded, csv_path);
        } else {
            simulated_feed.backfill();
        }
        simulated_feed.start();

        // Bots
        strategy::StrategyFactory factory(config.getTrendFollowConfig(),
                                          config.getCrossoverConfig(),
                                          config.getThresholdOscillatorConfig());
        engine::BotScheduler scheduler(engine_config, factory, prices, ledger);

        for (const auto& bot : config.getBots()) {
            TradingPair pair{bot.base, bot.quote};
            const engine::StartResult result = scheduler.start(bot.user, bot.strategy, pair, bot.stoploss);
            if (!result.ok()) {
                LOG_WARN("[{}] configured bot not started: {} ({})",
                         bot.user, engine::toString(result.status), result.message);
            }
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        LOG_INFO("Running. Press Ctrl+C to stop.");

        auto last_status = std::chrono::steady_clock::now();
        const auto status_interval = std::chrono::milliseconds(engine_config.cycle_interval_ms);
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            const auto now = std::chrono::steady_clock::now();
            if (now - last_status >= status_interval) {
                logStatus(scheduler, ledger);
                last_status = now;
            }
        }

        LOG_INFO("Shutdown signal received, stopping bots");
        scheduler.stopAll();
        simulated_feed.stop();
        logStatus(scheduler, ledger);

        Logger::getInstance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_ERROR("Fatal error: {}", e.what());
        Logger::getInstance().shutdown();
        return 1;
    }
}
