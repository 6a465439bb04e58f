#include "engine/BotScheduler.h"
#include "common/Logger.h"
#include "risk/PortfolioValuation.h"

#include <chrono>
#include <cmath>
#include <exception>
#include <thread>

namespace tradebots {
namespace engine {

namespace {
BotEvent eventFor(CycleOutcomeKind kind) {
    switch (kind) {
        case CycleOutcomeKind::STOPLOSS_TRIGGERED: return BotEvent::STOPLOSS_BREACHED;
        case CycleOutcomeKind::INSUFFICIENT_FUNDS: return BotEvent::FUNDS_REJECTED;
        case CycleOutcomeKind::INVALID_DECISION: return BotEvent::DECISION_REJECTED;
        default: return BotEvent::FAULT;
    }
}

StartResult startFailure(StartStatus status, std::string message) {
    LOG_WARN("Bot start rejected: {} ({})", toString(status), message);
    StartResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}
}

const char* toString(StartStatus status) {
    switch (status) {
        case StartStatus::STARTED: return "STARTED";
        case StartStatus::ALREADY_RUNNING: return "ALREADY_RUNNING";
        case StartStatus::UNKNOWN_STRATEGY: return "UNKNOWN_STRATEGY";
        case StartStatus::UNKNOWN_USER: return "UNKNOWN_USER";
        case StartStatus::INVALID_PAIR: return "INVALID_PAIR";
        case StartStatus::INVALID_STOPLOSS: return "INVALID_STOPLOSS";
        case StartStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

BotScheduler::BotScheduler(const EngineConfig& config,
                           const strategy::StrategyFactory& factory,
                           const market::PriceHistoryStore& prices,
                           portfolio::PortfolioLedger& ledger)
    : config_(config)
    , factory_(factory)
    , prices_(prices)
    , ledger_(ledger)
{}

BotScheduler::~BotScheduler() {
    stopAll();
}

StartResult BotScheduler::start(const UserId& user,
                                const std::string& strategy_id,
                                const TradingPair& pair,
                                double stoploss) {
    if (!factory_.isKnown(strategy_id)) {
        return startFailure(StartStatus::UNKNOWN_STRATEGY, "unknown strategy: " + strategy_id);
    }
    if (!std::isfinite(stoploss) || stoploss <= 0.0) {
        return startFailure(StartStatus::INVALID_STOPLOSS,
                            "stoploss must be positive: " + std::to_string(stoploss));
    }
    return start(user, factory_.create(strategy_id, stoploss), pair, stoploss);
}

StartResult BotScheduler::start(const UserId& user,
                                std::unique_ptr<strategy::IStrategy> strategy,
                                const TradingPair& pair,
                                double stoploss) {
    if (!strategy) {
        return startFailure(StartStatus::UNKNOWN_STRATEGY, "no strategy instance");
    }
    if (!ledger_.hasAccount(user)) {
        return startFailure(StartStatus::UNKNOWN_USER, "unknown user: " + user);
    }
    if (pair.base.empty() || pair.quote.empty() || pair.base == pair.quote) {
        return startFailure(StartStatus::INVALID_PAIR, "invalid pair: " + pair.symbol());
    }
    if (!std::isfinite(stoploss) || stoploss <= 0.0) {
        return startFailure(StartStatus::INVALID_STOPLOSS,
                            "stoploss must be positive: " + std::to_string(stoploss));
    }

    const strategy::StrategyInfo info = strategy->getInfo();
    auto handle = std::make_shared<BotHandle>(user, info.id, info.name, pair, stoploss);

    std::shared_ptr<BotHandle> replaced;
    if (!registry_.tryStart(user, handle, &replaced)) {
        return startFailure(StartStatus::ALREADY_RUNNING, "a bot is already running for " + user);
    }
    if (replaced) {
        replaced->join();
    }

    // Starting: capture the stoploss reference value
    const risk::Valuation valuation = risk::PortfolioValuation::valueUsd(ledger_.balances(user), prices_);
    if (!valuation.complete()) {
        LOG_WARN("[{}] stoploss reference leaves out {} unpriced assets",
                 user, valuation.unpriced_assets.size());
    }
    const double reference = valuation.total_usd;
    handle->setInitialValue(reference);

    auto runner = std::make_shared<BotRunner>(
        user, pair, std::move(strategy),
        risk::StoplossGuard(reference, stoploss),
        prices_, ledger_, config_);

    const bool launched = handle->launch([this, handle, runner]() {
        runLoop(handle, runner);
    }).changed;
    if (!launched) {
        return startFailure(StartStatus::CANCELLED, "bot stopped before its first cycle");
    }

    LOG_INFO("[{}] bot started: {} on {} (stoploss {:.2f}, reference {:.2f} USD)",
             user, info.id, pair.symbol(), stoploss, reference);

    StartResult result;
    result.status = StartStatus::STARTED;
    result.message = info.name + " started on " + pair.symbol();
    return result;
}

void BotScheduler::runLoop(std::shared_ptr<BotHandle> handle, std::shared_ptr<BotRunner> runner) {
    CancellationToken& token = handle->token();
    const auto interval = std::chrono::milliseconds(config_.cycle_interval_ms);

    try {
        while (!token.cancelled()) {
            const CycleOutcome outcome = runner->runCycle(token);
            handle->setCycleCount(runner->cycleCount());

            if (outcome.terminal()) {
                handle->apply(eventFor(outcome.kind), outcome.reason);
                break;
            }
            if (outcome.kind == CycleOutcomeKind::CANCELLED) {
                break;
            }
            if (outcome.kind == CycleOutcomeKind::TRADED) {
                LOG_DEBUG("[{}] cycle {} traded {}", handle->user(), outcome.cycle,
                          strategy::toString(outcome.decision.type));
            }
            if (token.waitFor(interval)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] bot fault: {}", handle->user(), e.what());
        handle->apply(BotEvent::FAULT, e.what());
    } catch (...) {
        LOG_ERROR("[{}] bot fault: unknown exception", handle->user());
        handle->apply(BotEvent::FAULT, "unknown exception");
    }
    handle->acknowledgeStop();

    const BotStatus final_status = handle->status();
    LOG_INFO("[{}] bot task exited: {} after {} cycles{}",
             handle->user(), toString(final_status.state), final_status.cycle_count,
             final_status.reason.empty() ? std::string() : " (" + final_status.reason + ")");
}

StopResult BotScheduler::stop(const UserId& user) {
    std::shared_ptr<BotHandle> handle;
    StopResult result = registry_.stop(user, &handle);
    if (handle) {
        handle->join();
        result.status = handle->status();
    }
    if (!result.was_running) {
        LOG_DEBUG("[{}] stop: not running ({})", user, toString(result.status.state));
    }
    return result;
}

bool BotScheduler::abort(const UserId& user, const std::string& reason) {
    const bool aborted = registry_.abort(user, reason);
    if (aborted) {
        if (auto handle = registry_.find(user)) {
            handle->join();
        }
    }
    return aborted;
}

BotStatus BotScheduler::status(const UserId& user) const {
    return registry_.status(user);
}

std::vector<UserId> BotScheduler::activeUsers() const {
    return registry_.activeUsers();
}

portfolio::LedgerResult BotScheduler::manualTrade(const UserId& user,
                                                  const TradingPair& pair,
                                                  TradeSide side,
                                                  double base_quantity) {
    // Held through the apply so a concurrent start cannot slip in between
    auto gate = registry_.lockUser(user);
    if (config_.reject_manual_trades_while_bot_active && registry_.isActive(user)) {
        LOG_WARN("[{}] manual trade rejected while a bot is running", user);
        portfolio::LedgerResult result;
        result.status = portfolio::LedgerStatus::BOT_ACTIVE;
        result.message = "stop the running bot before trading manually";
        return result;
    }

    auto price = prices_.pairPrice(pair.base, pair.quote);
    if (!price) {
        portfolio::LedgerResult result;
        result.status = portfolio::LedgerStatus::INVALID_PRICE;
        result.message = "no price for " + pair.symbol();
        return result;
    }

    portfolio::TradeAnnotations annotations;
    annotations.base_usd_price = prices_.latestUsdPrice(pair.base);
    annotations.quote_usd_price = prices_.latestUsdPrice(pair.quote);
    return ledger_.executeTrade(user, pair, side, base_quantity, *price, annotations);
}

double BotScheduler::portfolioValueUsd(const UserId& user) const {
    return risk::PortfolioValuation::valueUsd(ledger_.balances(user), prices_).total_usd;
}

void BotScheduler::stopAll() {
    for (const auto& handle : registry_.handles()) {
        handle->requestStop("scheduler shutdown");
    }
    for (const auto& handle : registry_.handles()) {
        handle->join();
    }
}

} // namespace engine
} // namespace tradebots
