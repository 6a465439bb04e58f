#pragma once

#include "common/Types.h"
#include "engine/CancellationToken.h"
#include "engine/EngineConfig.h"
#include "market/PriceHistoryStore.h"
#include "portfolio/PortfolioLedger.h"
#include "risk/PortfolioValuation.h"
#include "strategy/IStrategy.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tradebots {
namespace engine {

enum class CycleOutcomeKind {
    SKIPPED,                // no price data yet, counter not advanced
    HELD,
    TRADED,
    STOPLOSS_TRIGGERED,
    INSUFFICIENT_FUNDS,
    INVALID_DECISION,
    CANCELLED               // stop arrived before the ledger was touched
};

const char* toString(CycleOutcomeKind kind);

struct CycleOutcome {
    CycleOutcomeKind kind = CycleOutcomeKind::SKIPPED;
    uint64_t cycle = 0;
    strategy::Decision decision;
    double portfolio_value_usd = 0.0;
    std::optional<Transaction> transaction;
    std::string reason;

    bool terminal() const {
        return kind == CycleOutcomeKind::STOPLOSS_TRIGGERED ||
               kind == CycleOutcomeKind::INSUFFICIENT_FUNDS ||
               kind == CycleOutcomeKind::INVALID_DECISION;
    }
};

// One bot instance's cycle logic. Owned by exactly one task; not thread-safe.
class BotRunner {
public:
    BotRunner(UserId user,
              TradingPair pair,
              std::unique_ptr<strategy::IStrategy> strategy,
              risk::StoplossGuard guard,
              const market::PriceHistoryStore& prices,
              portfolio::PortfolioLedger& ledger,
              const EngineConfig& config);

    // Snapshot -> context -> decide -> stoploss check -> apply.
    // Strategy and ledger faults propagate as exceptions.
    CycleOutcome runCycle(const CancellationToken& token);

    uint64_t cycleCount() const { return cycle_; }

private:
    std::string tag() const;

    UserId user_;
    TradingPair pair_;
    std::unique_ptr<strategy::IStrategy> strategy_;
    std::string strategy_id_;
    risk::StoplossGuard guard_;
    const market::PriceHistoryStore& prices_;
    portfolio::PortfolioLedger& ledger_;
    EngineConfig config_;
    uint64_t cycle_;
};

} // namespace engine
} // namespace tradebots
