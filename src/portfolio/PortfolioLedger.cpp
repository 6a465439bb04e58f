#include "portfolio/PortfolioLedger.h"
#include "common/Logger.h"

#include <cmath>

namespace tradebots {
namespace portfolio {

namespace {
// Float residue left over when a buy spends the whole balance
constexpr double kBalanceEpsilon = 1e-9;

bool isPositiveFinite(double value) {
    return std::isfinite(value) && value > 0.0;
}

void settle(Balances& balances, const Asset& asset, double delta) {
    double& value = balances[asset];
    value += delta;
    if (std::fabs(value) < kBalanceEpsilon) {
        value = 0.0;
    }
}
}

const char* toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::APPLIED: return "APPLIED";
        case LedgerStatus::NO_ACTION: return "NO_ACTION";
        case LedgerStatus::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case LedgerStatus::INSUFFICIENT_ASSETS: return "INSUFFICIENT_ASSETS";
        case LedgerStatus::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case LedgerStatus::INVALID_PRICE: return "INVALID_PRICE";
        case LedgerStatus::UNKNOWN_USER: return "UNKNOWN_USER";
        case LedgerStatus::DEPOSIT_TOO_SMALL: return "DEPOSIT_TOO_SMALL";
        case LedgerStatus::DEPOSIT_TOO_LARGE: return "DEPOSIT_TOO_LARGE";
        case LedgerStatus::WITHDRAWAL_EXCEEDS_BALANCE: return "WITHDRAWAL_EXCEEDS_BALANCE";
        case LedgerStatus::BOT_ACTIVE: return "BOT_ACTIVE";
        case LedgerStatus::JOURNAL_FAILED: return "JOURNAL_FAILED";
    }
    return "UNKNOWN";
}

PortfolioLedger::PortfolioLedger(const engine::LedgerConfig& config,
                                 std::shared_ptr<core::ITransactionJournal> journal)
    : config_(config)
    , journal_(std::move(journal))
{}

// ===== Accounts =====

std::shared_ptr<PortfolioLedger::Account> PortfolioLedger::findAccount(const UserId& user) const {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    auto it = accounts_.find(user);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<PortfolioLedger::Account> PortfolioLedger::findOrCreateAccount(const UserId& user,
                                                                               bool& created) {
    std::unique_lock<std::shared_mutex> lock(accounts_mutex_);
    auto it = accounts_.find(user);
    if (it != accounts_.end()) {
        created = false;
        return it->second;
    }
    auto account = std::make_shared<Account>();
    accounts_.emplace(user, account);
    created = true;
    return account;
}

bool PortfolioLedger::openAccount(const UserId& user, double starting_cash) {
    bool created = false;
    auto account = findOrCreateAccount(user, created);
    if (!created) {
        LOG_WARN("Account already exists: {}", user);
        return false;
    }

    std::lock_guard<std::mutex> lock(account->mutex);
    account->balances[kUsd] = 0.0;
    if (starting_cash > 0.0) {
        Transaction tx;
        tx.user = user;
        tx.kind = TransactionKind::DEPOSIT;
        tx.base_asset = kUsd;
        tx.quote_asset = kUsd;
        tx.side = TradeSide::BUY;
        tx.quantity = starting_cash;
        tx.price = 1.0;
        tx.timestamp_ms = currentTimeMs();
        tx.base_usd_price = 1.0;
        tx.quote_usd_price = 1.0;
        LedgerResult grant = commitLocked(*account, std::move(tx));
        if (!grant.applied()) {
            LOG_ERROR("Starting cash for {} not granted: {}", user, grant.message);
        }
    }

    LOG_INFO("Account opened: {} (starting cash {:.2f} {})", user, starting_cash, kUsd);
    return true;
}

bool PortfolioLedger::hasAccount(const UserId& user) const {
    return findAccount(user) != nullptr;
}

std::vector<UserId> PortfolioLedger::users() const {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    std::vector<UserId> out;
    out.reserve(accounts_.size());
    for (const auto& [user, account] : accounts_) {
        out.push_back(user);
    }
    return out;
}

// ===== Trades =====

LedgerResult PortfolioLedger::validateAndApply(const UserId& user,
                                               const TradingPair& pair,
                                               const strategy::Decision& decision,
                                               double current_price,
                                               const TradeAnnotations& annotations) {
    if (decision.isHold()) {
        return LedgerResult();
    }
    if (!isPositiveFinite(decision.quote_amount)) {
        return reject(LedgerStatus::INVALID_AMOUNT,
                      "decision amount must be positive: " + std::to_string(decision.quote_amount));
    }
    if (!isPositiveFinite(current_price)) {
        return reject(LedgerStatus::INVALID_PRICE,
                      "price must be positive: " + std::to_string(current_price));
    }

    auto account = findAccount(user);
    if (!account) {
        return reject(LedgerStatus::UNKNOWN_USER, "unknown user: " + user);
    }

    Transaction tx;
    tx.user = user;
    tx.kind = TransactionKind::TRADE;
    tx.base_asset = pair.base;
    tx.quote_asset = pair.quote;
    tx.side = decision.type == strategy::DecisionType::BUY ? TradeSide::BUY : TradeSide::SELL;
    tx.quantity = decision.quote_amount / current_price;
    tx.price = current_price;
    tx.timestamp_ms = annotations.timestamp_ms > 0 ? annotations.timestamp_ms : currentTimeMs();
    tx.base_usd_price = annotations.base_usd_price;
    tx.quote_usd_price = annotations.quote_usd_price;
    tx.executed_by_bot = annotations.executed_by_bot;

    std::lock_guard<std::mutex> lock(account->mutex);
    return applyTradeLocked(*account, std::move(tx));
}

LedgerResult PortfolioLedger::executeTrade(const UserId& user,
                                           const TradingPair& pair,
                                           TradeSide side,
                                           double base_quantity,
                                           double price,
                                           const TradeAnnotations& annotations) {
    if (!isPositiveFinite(base_quantity)) {
        return reject(LedgerStatus::INVALID_AMOUNT,
                      "quantity must be positive: " + std::to_string(base_quantity));
    }
    if (!isPositiveFinite(price)) {
        return reject(LedgerStatus::INVALID_PRICE, "price must be positive: " + std::to_string(price));
    }

    auto account = findAccount(user);
    if (!account) {
        return reject(LedgerStatus::UNKNOWN_USER, "unknown user: " + user);
    }

    Transaction tx;
    tx.user = user;
    tx.kind = TransactionKind::TRADE;
    tx.base_asset = pair.base;
    tx.quote_asset = pair.quote;
    tx.side = side;
    tx.quantity = base_quantity;
    tx.price = price;
    tx.timestamp_ms = annotations.timestamp_ms > 0 ? annotations.timestamp_ms : currentTimeMs();
    tx.base_usd_price = annotations.base_usd_price;
    tx.quote_usd_price = annotations.quote_usd_price;
    tx.executed_by_bot = annotations.executed_by_bot;

    std::lock_guard<std::mutex> lock(account->mutex);
    return applyTradeLocked(*account, std::move(tx));
}

LedgerResult PortfolioLedger::applyTradeLocked(Account& account, Transaction tx) {
    if (tx.side == TradeSide::BUY) {
        const double cost = tx.quoteValue();
        const double available = account.balances[tx.quote_asset];
        if (available + kBalanceEpsilon < cost) {
            return reject(LedgerStatus::INSUFFICIENT_FUNDS,
                          "need " + std::to_string(cost) + " " + tx.quote_asset +
                          ", have " + std::to_string(available));
        }
    } else {
        const double available = account.balances[tx.base_asset];
        if (available + kBalanceEpsilon < tx.quantity) {
            return reject(LedgerStatus::INSUFFICIENT_ASSETS,
                          "need " + std::to_string(tx.quantity) + " " + tx.base_asset +
                          ", have " + std::to_string(available));
        }
    }
    return commitLocked(account, std::move(tx));
}

// ===== Cash =====

LedgerResult PortfolioLedger::deposit(const UserId& user, double amount) {
    if (!std::isfinite(amount)) {
        return reject(LedgerStatus::INVALID_AMOUNT, "deposit amount is not a number");
    }
    if (amount < config_.min_deposit) {
        return reject(LedgerStatus::DEPOSIT_TOO_SMALL,
                      "minimum deposit is " + std::to_string(config_.min_deposit));
    }
    if (amount > config_.max_deposit) {
        return reject(LedgerStatus::DEPOSIT_TOO_LARGE,
                      "maximum deposit is " + std::to_string(config_.max_deposit));
    }

    auto account = findAccount(user);
    if (!account) {
        return reject(LedgerStatus::UNKNOWN_USER, "unknown user: " + user);
    }

    Transaction tx;
    tx.user = user;
    tx.kind = TransactionKind::DEPOSIT;
    tx.base_asset = kUsd;
    tx.quote_asset = kUsd;
    tx.side = TradeSide::BUY;
    tx.quantity = amount;
    tx.price = 1.0;
    tx.timestamp_ms = currentTimeMs();
    tx.base_usd_price = 1.0;
    tx.quote_usd_price = 1.0;

    std::lock_guard<std::mutex> lock(account->mutex);
    return commitLocked(*account, std::move(tx));
}

LedgerResult PortfolioLedger::withdraw(const UserId& user, double amount) {
    if (!isPositiveFinite(amount)) {
        return reject(LedgerStatus::INVALID_AMOUNT, "withdrawal amount must be positive");
    }

    auto account = findAccount(user);
    if (!account) {
        return reject(LedgerStatus::UNKNOWN_USER, "unknown user: " + user);
    }

    std::lock_guard<std::mutex> lock(account->mutex);
    const double available = account->balances[kUsd];
    if (amount > available) {
        return reject(LedgerStatus::WITHDRAWAL_EXCEEDS_BALANCE,
                      "withdrawal " + std::to_string(amount) + " exceeds balance " +
                      std::to_string(available));
    }

    Transaction tx;
    tx.user = user;
    tx.kind = TransactionKind::WITHDRAWAL;
    tx.base_asset = kUsd;
    tx.quote_asset = kUsd;
    tx.side = TradeSide::SELL;
    tx.quantity = amount;
    tx.price = 1.0;
    tx.timestamp_ms = currentTimeMs();
    tx.base_usd_price = 1.0;
    tx.quote_usd_price = 1.0;
    return commitLocked(*account, std::move(tx));
}

// ===== Commit =====

// Journal first: memory only changes once the record is durable, so a
// replay always reproduces the live balances.
LedgerResult PortfolioLedger::commitLocked(Account& account, Transaction tx) {
    if (journal_ && !journal_->append(tx)) {
        const size_t failures = ++journal_failures_;
        LOG_ERROR("Journal append failed for {} ({} {}), transaction dropped ({} so far)",
                  tx.user, toString(tx.kind), toString(tx.side), failures);
        LedgerResult result;
        result.status = LedgerStatus::JOURNAL_FAILED;
        result.message = "transaction could not be journaled";
        return result;
    }

    applyToBalances(account.balances, tx);
    account.history.push_back(tx);

    Logger::getInstance().logTransaction(tx);

    if (tx.kind == TransactionKind::TRADE) {
        LOG_INFO("[{}] {} {:.8f} {} @ {:.4f} {}{}",
                 tx.user, toString(tx.side), tx.quantity, tx.base_asset,
                 tx.price, tx.quote_asset,
                 tx.executed_by_bot ? " by " + *tx.executed_by_bot : std::string());
    } else {
        LOG_INFO("[{}] {} {:.2f} {}", tx.user, toString(tx.kind), tx.quantity, tx.base_asset);
    }

    LedgerResult result;
    result.status = LedgerStatus::APPLIED;
    result.transaction = std::move(tx);
    return result;
}

void PortfolioLedger::applyToBalances(Balances& balances, const Transaction& tx) {
    switch (tx.kind) {
        case TransactionKind::DEPOSIT:
            settle(balances, tx.base_asset, tx.quantity);
            break;
        case TransactionKind::WITHDRAWAL:
            settle(balances, tx.base_asset, -tx.quantity);
            break;
        case TransactionKind::TRADE:
            if (tx.side == TradeSide::BUY) {
                settle(balances, tx.quote_asset, -tx.quoteValue());
                settle(balances, tx.base_asset, tx.quantity);
            } else {
                settle(balances, tx.base_asset, -tx.quantity);
                settle(balances, tx.quote_asset, tx.quoteValue());
            }
            break;
    }
}

LedgerResult PortfolioLedger::reject(LedgerStatus status, std::string message) {
    LOG_WARN("Ledger rejected: {} ({})", toString(status), message);
    LedgerResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

// ===== Queries =====

Balances PortfolioLedger::balances(const UserId& user) const {
    auto account = findAccount(user);
    if (!account) {
        return {};
    }
    std::lock_guard<std::mutex> lock(account->mutex);
    return account->balances;
}

double PortfolioLedger::balance(const UserId& user, const Asset& asset) const {
    auto account = findAccount(user);
    if (!account) {
        return 0.0;
    }
    std::lock_guard<std::mutex> lock(account->mutex);
    auto it = account->balances.find(asset);
    return it != account->balances.end() ? it->second : 0.0;
}

std::vector<Transaction> PortfolioLedger::history(const UserId& user) const {
    auto account = findAccount(user);
    if (!account) {
        return {};
    }
    std::lock_guard<std::mutex> lock(account->mutex);
    return account->history;
}

std::optional<AccountSnapshot> PortfolioLedger::snapshot(const UserId& user) const {
    auto account = findAccount(user);
    if (!account) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(account->mutex);
    AccountSnapshot out;
    out.balances = account->balances;
    out.history = account->history;
    return out;
}

LifetimeStats PortfolioLedger::lifetimeStats(const UserId& user) const {
    return computeLifetimeStats(history(user));
}

LifetimeStats PortfolioLedger::computeLifetimeStats(const std::vector<Transaction>& history) {
    LifetimeStats stats;
    for (const auto& tx : history) {
        switch (tx.kind) {
            case TransactionKind::DEPOSIT:
                stats.deposits++;
                stats.total_deposited += tx.quantity;
                break;
            case TransactionKind::WITHDRAWAL:
                stats.withdrawals++;
                stats.total_withdrawn += tx.quantity;
                break;
            case TransactionKind::TRADE:
                stats.trades++;
                if (tx.side == TradeSide::BUY) {
                    stats.buys++;
                    stats.quote_bought += tx.quoteValue();
                } else {
                    stats.sells++;
                    stats.quote_sold += tx.quoteValue();
                }
                if (tx.executed_by_bot) {
                    stats.bot_trades++;
                }
                break;
        }
    }
    return stats;
}

// ===== Restore =====

size_t PortfolioLedger::restore(const std::vector<Transaction>& transactions) {
    size_t applied = 0;
    for (const auto& tx : transactions) {
        if (tx.user.empty()) {
            LOG_WARN("Skipping journaled transaction without user");
            continue;
        }
        bool created = false;
        auto account = findOrCreateAccount(tx.user, created);

        std::lock_guard<std::mutex> lock(account->mutex);
        applyToBalances(account->balances, tx);
        account->history.push_back(tx);
        applied++;

        for (const auto& [asset, value] : account->balances) {
            if (value < 0.0) {
                LOG_WARN("Restored balance is negative: {} {} = {}", tx.user, asset, value);
            }
        }
    }
    if (applied > 0) {
        LOG_INFO("Ledger restored: {} transactions, {} accounts", applied, users().size());
    }
    return applied;
}

} // namespace portfolio
} // namespace tradebots
