#pragma once

#include "common/Types.h"
#include "core/contracts/ITransactionJournal.h"
#include "engine/EngineConfig.h"
#include "strategy/IStrategy.h"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tradebots {
namespace portfolio {

enum class LedgerStatus {
    APPLIED,
    NO_ACTION,                  // HOLD decision
    INSUFFICIENT_FUNDS,         // quote balance too low for a buy
    INSUFFICIENT_ASSETS,        // base balance too low for a sell
    INVALID_AMOUNT,             // zero, negative or non-finite amount
    INVALID_PRICE,
    UNKNOWN_USER,
    DEPOSIT_TOO_SMALL,
    DEPOSIT_TOO_LARGE,
    WITHDRAWAL_EXCEEDS_BALANCE,
    BOT_ACTIVE,                 // manual trade while the user's bot runs
    JOURNAL_FAILED              // not persisted, so not applied either
};

const char* toString(LedgerStatus status);

struct LedgerResult {
    LedgerStatus status;
    std::optional<Transaction> transaction;
    std::string message;

    LedgerResult() : status(LedgerStatus::NO_ACTION) {}

    bool applied() const { return status == LedgerStatus::APPLIED; }
    bool insufficientBalance() const {
        return status == LedgerStatus::INSUFFICIENT_FUNDS ||
               status == LedgerStatus::INSUFFICIENT_ASSETS;
    }
};

// Context recorded with a transaction, captured by the caller
struct TradeAnnotations {
    std::optional<double> base_usd_price;
    std::optional<double> quote_usd_price;
    std::optional<std::string> executed_by_bot;
    long long timestamp_ms = 0;     // 0 = now
};

// Balances and history read under one lock, so they always agree
struct AccountSnapshot {
    Balances balances;
    std::vector<Transaction> history;
};

// Derived from the history on demand, never stored
struct LifetimeStats {
    int deposits = 0;
    int withdrawals = 0;
    int trades = 0;
    int buys = 0;
    int sells = 0;
    int bot_trades = 0;
    double total_deposited = 0.0;
    double total_withdrawn = 0.0;
    double quote_bought = 0.0;      // quote spent on buys
    double quote_sold = 0.0;        // quote received from sells
};

// Per-user balances plus append-only transaction history.
// Each account has its own lock: every balance change and its transaction
// record are applied under that lock, so readers never see one without the
// other, and unrelated users never contend.
class PortfolioLedger {
public:
    explicit PortfolioLedger(const engine::LedgerConfig& config,
                             std::shared_ptr<core::ITransactionJournal> journal = nullptr);

    // Creates the account and records starting cash as a deposit.
    // Returns false if the account already exists.
    bool openAccount(const UserId& user, double starting_cash);
    bool hasAccount(const UserId& user) const;
    std::vector<UserId> users() const;

    // Converts the quote amount to base units at current_price, checks the
    // balance and applies the trade in one step.
    LedgerResult validateAndApply(
        const UserId& user,
        const TradingPair& pair,
        const strategy::Decision& decision,
        double current_price,
        const TradeAnnotations& annotations = TradeAnnotations()
    );

    // Manual trade sized in base units
    LedgerResult executeTrade(
        const UserId& user,
        const TradingPair& pair,
        TradeSide side,
        double base_quantity,
        double price,
        const TradeAnnotations& annotations = TradeAnnotations()
    );

    LedgerResult deposit(const UserId& user, double amount);
    LedgerResult withdraw(const UserId& user, double amount);

    Balances balances(const UserId& user) const;
    double balance(const UserId& user, const Asset& asset) const;
    std::vector<Transaction> history(const UserId& user) const;
    std::optional<AccountSnapshot> snapshot(const UserId& user) const;

    LifetimeStats lifetimeStats(const UserId& user) const;
    static LifetimeStats computeLifetimeStats(const std::vector<Transaction>& history);

    // Rebuilds accounts from journaled transactions (startup only)
    size_t restore(const std::vector<Transaction>& transactions);

    // Transactions refused because the journal could not record them
    size_t journalFailures() const { return journal_failures_.load(); }

private:
    struct Account {
        mutable std::mutex mutex;
        Balances balances;
        std::vector<Transaction> history;
    };

    std::shared_ptr<Account> findAccount(const UserId& user) const;
    std::shared_ptr<Account> findOrCreateAccount(const UserId& user, bool& created);

    LedgerResult applyTradeLocked(Account& account, Transaction tx);
    LedgerResult commitLocked(Account& account, Transaction tx);
    static void applyToBalances(Balances& balances, const Transaction& tx);
    static LedgerResult reject(LedgerStatus status, std::string message);

    engine::LedgerConfig config_;
    std::shared_ptr<core::ITransactionJournal> journal_;

    std::map<UserId, std::shared_ptr<Account>> accounts_;
    mutable std::shared_mutex accounts_mutex_;

    std::atomic<size_t> journal_failures_{0};
};

} // namespace portfolio
} // namespace tradebots
