#include "core/state/TransactionJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace tradebots {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

TransactionKind kindFromString(const std::string& value) {
    if (value == "DEPOSIT") return TransactionKind::DEPOSIT;
    if (value == "WITHDRAWAL") return TransactionKind::WITHDRAWAL;
    return TransactionKind::TRADE;
}

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}
}

TransactionJournalJsonl::TransactionJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = std::max(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool TransactionJournalJsonl::append(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create journal directory {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["tx"] = toJson(tx);

    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEntry> TransactionJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            const auto seq = parseSeq(line);
            if (seq < seq_inclusive || !line.contains("tx")) {
                continue;
            }

            JournalEntry entry;
            entry.seq = seq;
            entry.transaction = fromJson(line["tx"]);
            out.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line: {}", e.what());
        }
    }

    return out;
}

std::uint64_t TransactionJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

nlohmann::json TransactionJournalJsonl::toJson(const Transaction& tx) {
    nlohmann::json j;
    j["user"] = tx.user;
    j["kind"] = toString(tx.kind);
    j["base"] = tx.base_asset;
    j["quote"] = tx.quote_asset;
    j["side"] = toString(tx.side);
    j["quantity"] = tx.quantity;
    j["price"] = tx.price;
    j["ts_ms"] = tx.timestamp_ms;
    j["base_usd"] = tx.base_usd_price ? nlohmann::json(*tx.base_usd_price) : nlohmann::json(nullptr);
    j["quote_usd"] = tx.quote_usd_price ? nlohmann::json(*tx.quote_usd_price) : nlohmann::json(nullptr);
    j["bot"] = tx.executed_by_bot ? nlohmann::json(*tx.executed_by_bot) : nlohmann::json(nullptr);
    return j;
}

Transaction TransactionJournalJsonl::fromJson(const nlohmann::json& j) {
    Transaction tx;
    tx.user = j.value("user", std::string());
    tx.kind = kindFromString(j.value("kind", std::string("TRADE")));
    tx.base_asset = j.value("base", std::string());
    tx.quote_asset = j.value("quote", std::string());
    tx.side = j.value("side", std::string("BUY")) == "SELL" ? TradeSide::SELL : TradeSide::BUY;
    tx.quantity = j.value("quantity", 0.0);
    tx.price = j.value("price", 0.0);
    tx.timestamp_ms = j.value("ts_ms", 0LL);
    tx.base_usd_price = optionalNumber(j, "base_usd");
    tx.quote_usd_price = optionalNumber(j, "quote_usd");
    if (j.contains("bot") && j["bot"].is_string()) {
        tx.executed_by_bot = j["bot"].get<std::string>();
    }
    return tx;
}

} // namespace core
} // namespace tradebots
