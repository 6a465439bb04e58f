#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>

namespace tradebots {

using UserId = std::string;
using Asset = std::string;
using Price = double;
using Quantity = double;
using Balances = std::map<Asset, double>;

inline constexpr const char* kUsd = "USD";

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// One sample from the price feed. Prices are USD per unit of asset.
struct PricePoint {
    long long timestamp_ms;
    Asset asset;
    Price price;

    PricePoint() : timestamp_ms(0), price(0) {}

    PricePoint(long long ts, Asset a, Price p)
        : timestamp_ms(ts), asset(std::move(a)), price(p) {}
};

// base/quote, e.g. BTC/USD
struct TradingPair {
    Asset base;
    Asset quote;

    std::string symbol() const { return base + "/" + quote; }
};

enum class TradeSide { BUY, SELL };
enum class TransactionKind { TRADE, DEPOSIT, WITHDRAWAL };

struct Transaction {
    UserId user;
    TransactionKind kind;
    Asset base_asset;
    Asset quote_asset;
    TradeSide side;             // TRADE only; deposits are BUY, withdrawals SELL
    Quantity quantity;          // base units
    Price price;                // quote per base
    long long timestamp_ms;

    // USD prices captured at execution time
    std::optional<double> base_usd_price;
    std::optional<double> quote_usd_price;

    std::optional<std::string> executed_by_bot;

    Transaction()
        : kind(TransactionKind::TRADE)
        , side(TradeSide::BUY)
        , quantity(0)
        , price(0)
        , timestamp_ms(0)
    {}

    double quoteValue() const { return quantity * price; }
};

inline const char* toString(TradeSide side) {
    return side == TradeSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::TRADE: return "TRADE";
        case TransactionKind::DEPOSIT: return "DEPOSIT";
        case TransactionKind::WITHDRAWAL: return "WITHDRAWAL";
    }
    return "TRADE";
}

} // namespace tradebots
