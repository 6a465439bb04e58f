#include "engine/BotRunner.h"
#include "analytics/IndicatorSnapshot.h"
#include "common/Logger.h"

#include <stdexcept>

namespace tradebots {
namespace engine {

const char* toString(CycleOutcomeKind kind) {
    switch (kind) {
        case CycleOutcomeKind::SKIPPED: return "SKIPPED";
        case CycleOutcomeKind::HELD: return "HELD";
        case CycleOutcomeKind::TRADED: return "TRADED";
        case CycleOutcomeKind::STOPLOSS_TRIGGERED: return "STOPLOSS_TRIGGERED";
        case CycleOutcomeKind::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case CycleOutcomeKind::INVALID_DECISION: return "INVALID_DECISION";
        case CycleOutcomeKind::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

BotRunner::BotRunner(UserId user,
                     TradingPair pair,
                     std::unique_ptr<strategy::IStrategy> strategy,
                     risk::StoplossGuard guard,
                     const market::PriceHistoryStore& prices,
                     portfolio::PortfolioLedger& ledger,
                     const EngineConfig& config)
    : user_(std::move(user))
    , pair_(std::move(pair))
    , strategy_(std::move(strategy))
    , guard_(guard)
    , prices_(prices)
    , ledger_(ledger)
    , config_(config)
    , cycle_(0)
{
    if (!strategy_) {
        throw std::invalid_argument("BotRunner requires a strategy");
    }
    strategy_id_ = strategy_->getInfo().id;
}

std::string BotRunner::tag() const {
    return user_ + "/" + strategy_id_ + "/" + pair_.symbol();
}

CycleOutcome BotRunner::runCycle(const CancellationToken& token) {
    CycleOutcome outcome;
    if (token.cancelled()) {
        outcome.kind = CycleOutcomeKind::CANCELLED;
        return outcome;
    }

    // 1. Market snapshot
    auto window = prices_.snapshot(pair_.base, config_.context_window);
    auto current_price = prices_.pairPrice(pair_.base, pair_.quote);
    if (window.empty() || !current_price) {
        LOG_DEBUG("[{}] no price data for {}, cycle skipped", tag(), pair_.symbol());
        outcome.kind = CycleOutcomeKind::SKIPPED;
        outcome.cycle = cycle_;
        return outcome;
    }

    // 2. Balances as they stand at the start of the cycle
    const Balances balances = ledger_.balances(user_);
    auto balanceOf = [&balances](const Asset& asset) {
        auto it = balances.find(asset);
        return it != balances.end() ? it->second : 0.0;
    };

    // 3. Context
    strategy::BotContext ctx;
    ctx.indicators = analytics::IndicatorSnapshot::compute(window, strategy_->requiredIndicators());
    ctx.price_window = std::move(window);
    ctx.base_balance = balanceOf(pair_.base);
    ctx.quote_balance = balanceOf(pair_.quote);
    ctx.current_price = *current_price;
    ctx.pair = pair_;
    ctx.cycle = ++cycle_;
    outcome.cycle = ctx.cycle;

    // 4. Decide
    const strategy::Decision decision = strategy_->decide(ctx);
    outcome.decision = decision;

    // 5. Stoploss on the start-of-cycle balances, before any trade
    const risk::Valuation valuation = risk::PortfolioValuation::valueUsd(balances, prices_);
    outcome.portfolio_value_usd = valuation.total_usd;
    if (guard_.isBreached(valuation.total_usd)) {
        outcome.kind = CycleOutcomeKind::STOPLOSS_TRIGGERED;
        outcome.reason = fmt::format("portfolio {:.2f} USD lost {:.2f} (limit {:.2f})",
                                     valuation.total_usd,
                                     guard_.loss(valuation.total_usd),
                                     guard_.threshold());
        LOG_WARN("[{}] stoploss triggered at cycle {}: {}", tag(), ctx.cycle, outcome.reason);
        return outcome;
    }

    if (decision.isHold()) {
        outcome.kind = CycleOutcomeKind::HELD;
        return outcome;
    }

    if (token.cancelled()) {
        LOG_INFO("[{}] cancelled before applying {} at cycle {}",
                 tag(), strategy::toString(decision.type), ctx.cycle);
        outcome.kind = CycleOutcomeKind::CANCELLED;
        return outcome;
    }

    // 6. Apply
    portfolio::TradeAnnotations annotations;
    annotations.base_usd_price = prices_.latestUsdPrice(pair_.base);
    annotations.quote_usd_price = prices_.latestUsdPrice(pair_.quote);
    annotations.executed_by_bot = strategy_id_;

    portfolio::LedgerResult result =
        ledger_.validateAndApply(user_, pair_, decision, ctx.current_price, annotations);

    switch (result.status) {
        case portfolio::LedgerStatus::APPLIED:
            outcome.kind = CycleOutcomeKind::TRADED;
            outcome.transaction = result.transaction;
            strategy_->onDecisionApplied(decision, *result.transaction);
            return outcome;
        case portfolio::LedgerStatus::INSUFFICIENT_FUNDS:
        case portfolio::LedgerStatus::INSUFFICIENT_ASSETS:
            outcome.kind = CycleOutcomeKind::INSUFFICIENT_FUNDS;
            outcome.reason = result.message;
            LOG_WARN("[{}] {} rejected: {}", tag(), strategy::toString(decision.type), result.message);
            return outcome;
        case portfolio::LedgerStatus::INVALID_AMOUNT:
        case portfolio::LedgerStatus::INVALID_PRICE:
            outcome.kind = CycleOutcomeKind::INVALID_DECISION;
            outcome.reason = result.message;
            LOG_WARN("[{}] invalid decision: {}", tag(), result.message);
            return outcome;
        default:
            throw std::runtime_error(std::string("ledger failure: ") +
                                     portfolio::toString(result.status) + " " + result.message);
    }
}

} // namespace engine
} // namespace tradebots
