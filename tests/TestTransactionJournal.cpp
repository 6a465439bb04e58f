#include "core/state/TransactionJournalJsonl.h"
#include "portfolio/PortfolioLedger.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

int main() {
    using namespace tradebots;

    const auto path = std::filesystem::temp_directory_path() / "tradebots_test" / "test_transactions.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    // Ledger writes every mutation through the journal
    {
        auto journal = std::make_shared<core::TransactionJournalJsonl>(path);
        portfolio::PortfolioLedger ledger(engine::LedgerConfig{}, journal);
        ledger.openAccount("alice", 10000.0);

        portfolio::TradeAnnotations annotations;
        annotations.executed_by_bot = std::string("crossover");
        annotations.base_usd_price = 50000.0;
        auto r = ledger.validateAndApply("alice", TradingPair{"BTC", "USD"},
                                         strategy::Decision::buy(1000.0), 50000.0, annotations);
        if (!r.applied()) {
            std::cerr << "[TEST] buy should apply\n";
            return 1;
        }
        if (!ledger.withdraw("alice", 100.0).applied()) {
            std::cerr << "[TEST] withdraw should apply\n";
            return 1;
        }
        // Rejections are not journaled
        ledger.withdraw("alice", 1e9);

        if (journal->lastSeq() != 3) {
            std::cerr << "[TEST] lastSeq should be 3, got " << journal->lastSeq() << "\n";
            return 1;
        }
    }

    // A new journal on the same file continues the sequence
    core::TransactionJournalJsonl reopened(path);
    if (reopened.lastSeq() != 3) {
        std::cerr << "[TEST] reopened lastSeq should be 3, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    const auto rows = reopened.readFrom(2);
    if (rows.size() != 2) {
        std::cerr << "[TEST] readFrom(2) should return 2 rows, got " << rows.size() << "\n";
        return 1;
    }
    const Transaction& trade = rows.front().transaction;
    if (trade.kind != TransactionKind::TRADE || trade.side != TradeSide::BUY ||
        !trade.executed_by_bot || *trade.executed_by_bot != "crossover" ||
        !trade.base_usd_price || trade.quote_usd_price.has_value()) {
        std::cerr << "[TEST] trade fields not preserved\n";
        return 1;
    }

    // Malformed lines are skipped
    {
        std::ofstream out(path, std::ios::app);
        out << "{not json\n";
    }
    core::TransactionJournalJsonl damaged(path);

    // Replay rebuilds the same balances
    std::vector<Transaction> replay;
    for (auto& entry : damaged.readFrom(1)) {
        replay.push_back(entry.transaction);
    }
    portfolio::PortfolioLedger restored(engine::LedgerConfig{});
    if (restored.restore(replay) != 3) {
        std::cerr << "[TEST] restore should apply 3 transactions\n";
        return 1;
    }
    if (std::abs(restored.balance("alice", kUsd) - 8900.0) > 1e-6 ||
        std::abs(restored.balance("alice", "BTC") - 0.02) > 1e-12) {
        std::cerr << "[TEST] restored balances mismatch\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] TransactionJournal PASSED\n";
    return 0;
}
