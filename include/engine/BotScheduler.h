#pragma once

#include "common/Types.h"
#include "engine/ActiveBotRegistry.h"
#include "engine/BotRunner.h"
#include "engine/EngineConfig.h"
#include "market/PriceHistoryStore.h"
#include "portfolio/PortfolioLedger.h"
#include "strategy/StrategyFactory.h"
#include <memory>
#include <string>
#include <vector>

namespace tradebots {
namespace engine {

enum class StartStatus {
    STARTED,
    ALREADY_RUNNING,
    UNKNOWN_STRATEGY,
    UNKNOWN_USER,
    INVALID_PAIR,
    INVALID_STOPLOSS,
    CANCELLED           // stopped while still starting
};

const char* toString(StartStatus status);

struct StartResult {
    StartStatus status = StartStatus::STARTED;
    std::string message;

    bool ok() const { return status == StartStatus::STARTED; }
};

// Runs one task per active bot. All public methods are safe to call
// concurrently for different users and are well-defined when repeated
// for the same user.
class BotScheduler {
public:
    BotScheduler(const EngineConfig& config,
                 const strategy::StrategyFactory& factory,
                 const market::PriceHistoryStore& prices,
                 portfolio::PortfolioLedger& ledger);
    ~BotScheduler();

    BotScheduler(const BotScheduler&) = delete;
    BotScheduler& operator=(const BotScheduler&) = delete;

    StartResult start(const UserId& user,
                      const std::string& strategy_id,
                      const TradingPair& pair,
                      double stoploss);

    // Runs a caller-built strategy instance
    StartResult start(const UserId& user,
                      std::unique_ptr<strategy::IStrategy> strategy,
                      const TradingPair& pair,
                      double stoploss);

    // Returns once the bot's task has exited
    StopResult stop(const UserId& user);

    bool abort(const UserId& user, const std::string& reason);

    BotStatus status(const UserId& user) const;
    std::vector<UserId> activeUsers() const;

    // Manual trade at the current pair price, sized in base units
    portfolio::LedgerResult manualTrade(const UserId& user,
                                        const TradingPair& pair,
                                        TradeSide side,
                                        double base_quantity);

    double portfolioValueUsd(const UserId& user) const;

    void stopAll();

private:
    void runLoop(std::shared_ptr<BotHandle> handle, std::shared_ptr<BotRunner> runner);

    EngineConfig config_;
    const strategy::StrategyFactory& factory_;
    const market::PriceHistoryStore& prices_;
    portfolio::PortfolioLedger& ledger_;
    ActiveBotRegistry registry_;
};

} // namespace engine
} // namespace tradebots
