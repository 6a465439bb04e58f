#pragma once

#include <cstdint>
#include <vector>

#include "common/Types.h"

namespace tradebots {
namespace core {

struct JournalEntry {
    std::uint64_t seq = 0;
    Transaction transaction;
};

// Append-only store of ledger transactions, replayed on startup
class ITransactionJournal {
public:
    virtual ~ITransactionJournal() = default;

    virtual bool append(const Transaction& tx) = 0;
    virtual std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace tradebots
