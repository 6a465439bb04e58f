#undef NDEBUG
#include "market/PriceWindow.h"
#include "market/PriceHistoryStore.h"
#include "risk/PortfolioValuation.h"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

using namespace tradebots;
using tradebots::market::PriceHistoryStore;
using tradebots::market::PriceWindow;

namespace {
bool chronological(const std::vector<PricePoint>& points) {
    for (size_t i = 1; i < points.size(); ++i) {
        if (points[i].timestamp_ms <= points[i - 1].timestamp_ms) {
            return false;
        }
    }
    return true;
}
}

int main() {
    std::cout << "[TEST] Starting PriceWindow Test..." << std::endl;

    // Eviction keeps exactly the newest `capacity` points
    {
        PriceWindow window(5);
        for (int i = 1; i <= 12; ++i) {
            assert(window.append(PricePoint(i * 1000, "BTC", 100.0 + i)));
            assert(window.size() == static_cast<size_t>(std::min(i, 5)));
        }
        auto all = window.snapshotAll();
        assert(all.size() == 5);
        assert(chronological(all));
        assert(all.front().timestamp_ms == 8000);
        assert(all.back().timestamp_ms == 12000);
        assert(window.latest()->price == 112.0);
    }

    // snapshot(count) returns the most recent points, fewer when short
    {
        PriceWindow window(10);
        for (int i = 1; i <= 4; ++i) {
            window.append(PricePoint(i, "ETH", i * 10.0));
        }
        auto last2 = window.snapshot(2);
        assert(last2.size() == 2);
        assert(last2[0].price == 30.0 && last2[1].price == 40.0);
        assert(window.snapshot(100).size() == 4);
        assert(window.snapshot(0).empty());
    }

    // Out-of-order and duplicate timestamps are rejected
    {
        PriceWindow window(3);
        assert(window.append(PricePoint(10, "BTC", 1.0)));
        assert(!window.append(PricePoint(10, "BTC", 2.0)));
        assert(!window.append(PricePoint(5, "BTC", 3.0)));
        assert(window.size() == 1);
        assert(window.latest()->price == 1.0);
    }

    // Non-finite and non-positive prices never enter a window
    {
        PriceWindow window(3);
        assert(window.append(PricePoint(1, "BTC", 50000.0)));
        assert(!window.append(PricePoint(2, "BTC", std::numeric_limits<double>::quiet_NaN())));
        assert(!window.append(PricePoint(3, "BTC", std::numeric_limits<double>::infinity())));
        assert(!window.append(PricePoint(4, "BTC", 0.0)));
        assert(!window.append(PricePoint(5, "BTC", -1.0)));
        assert(window.size() == 1);
        assert(window.latest()->price == 50000.0);
        assert(window.append(PricePoint(6, "BTC", 49000.0)));
    }

    // A NaN feed cannot blind the stoploss: valuation stays on the last good price
    {
        PriceHistoryStore store(10);
        store.append(PricePoint(1, "BTC", 50000.0));
        assert(!store.append(PricePoint(2, "BTC", std::numeric_limits<double>::quiet_NaN())));

        Balances holdings;
        holdings["BTC"] = 1.0;
        auto valuation = risk::PortfolioValuation::valueUsd(holdings, store);
        assert(valuation.total_usd == 50000.0);
        assert(valuation.complete());

        risk::StoplossGuard guard(50000.0, 500.0);
        assert(!guard.isBreached(valuation.total_usd));
        assert(guard.isBreached(49500.0));
        assert(guard.isBreached(std::numeric_limits<double>::quiet_NaN()));
    }

    // Empty window
    {
        PriceWindow window(3);
        assert(!window.latest().has_value());
        assert(window.snapshot(3).empty());

        bool threw = false;
        try {
            PriceWindow invalid(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Readers never see a torn buffer while one writer appends
    {
        PriceWindow window(64);
        std::atomic<bool> done{false};
        std::atomic<bool> failed{false};

        std::thread writer([&]() {
            for (int i = 1; i <= 20000; ++i) {
                window.append(PricePoint(i, "BTC", static_cast<double>(i)));
            }
            done.store(true);
        });

        std::vector<std::thread> readers;
        for (int r = 0; r < 3; ++r) {
            readers.emplace_back([&]() {
                while (!done.load()) {
                    auto snap = window.snapshot(32);
                    if (snap.size() > 32 || !chronological(snap)) {
                        failed.store(true);
                    }
                    for (const auto& p : snap) {
                        if (p.price != static_cast<double>(p.timestamp_ms)) {
                            failed.store(true);
                        }
                    }
                }
            });
        }

        writer.join();
        for (auto& t : readers) {
            t.join();
        }
        assert(!failed.load());
        assert(window.size() == 64);
        assert(window.latest()->timestamp_ms == 20000);
    }

    // Store: pair price and USD
    {
        PriceHistoryStore store(100);
        assert(!store.pairPrice("BTC", "USD").has_value());
        store.append(PricePoint(1, "BTC", 50000.0));
        store.append(PricePoint(1, "ETH", 2500.0));

        assert(*store.latestUsdPrice("USD") == 1.0);
        assert(*store.pairPrice("BTC", "USD") == 50000.0);
        assert(std::abs(*store.pairPrice("BTC", "ETH") - 20.0) < 1e-12);
        assert(!store.pairPrice("SOL", "USD").has_value());
        assert(*store.newestTimestamp("BTC") == 1);
        assert(store.assets().size() == 2);
        assert(store.snapshot("BTC", 10).size() == 1);
        assert(store.snapshot("DOGE", 10).empty());
    }

    std::cout << "[TEST] PriceWindow Test PASSED!" << std::endl;
    return 0;
}
