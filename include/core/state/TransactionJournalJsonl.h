#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/ITransactionJournal.h"

namespace tradebots {
namespace core {

// One JSON object per line: {"seq":..,"tx":{...}}
class TransactionJournalJsonl : public ITransactionJournal {
public:
    explicit TransactionJournalJsonl(std::filesystem::path file_path);

    bool append(const Transaction& tx) override;
    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static nlohmann::json toJson(const Transaction& tx);
    static Transaction fromJson(const nlohmann::json& j);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace tradebots
