#undef NDEBUG
#include "feed/PriceHistoryLoader.h"
#include "feed/SimulatedPriceFeed.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

using namespace tradebots;

int main() {
    std::cout << "[TEST] Starting PriceFeed Test..." << std::endl;

    // CSV backfill: header skipped, bad rows skipped, out-of-order input sorted
    {
        const auto path = std::filesystem::temp_directory_path() / "tradebots_test_prices.csv";
        {
            std::ofstream out(path);
            out << "timestamp_ms,asset,price\n";
            out << "3000,BTC,50300\n";
            out << "1000,BTC,50100\n";
            out << "2000,BTC,50200\n";
            out << "2000,ETH,3000\n";
            out << "4000,BTC,not_a_price\n";
            out << "5000,BTC,-1\n";
        }
        auto points = feed::PriceHistoryLoader::loadCSV(path.string());
        assert(points.size() == 4);

        market::PriceHistoryStore store(100);
        assert(feed::PriceHistoryLoader::backfill(store, points) == 4);
        auto btc = store.snapshot("BTC", 10);
        assert(btc.size() == 3);
        assert(btc.front().price == 50100.0);
        assert(btc.back().price == 50300.0);
        assert(*store.latestUsdPrice("ETH") == 3000.0);

        // Replaying the same points again adds nothing
        assert(feed::PriceHistoryLoader::backfill(store, points) == 0);

        assert(feed::PriceHistoryLoader::loadCSV("/nonexistent/prices.csv").empty());
        std::filesystem::remove(path);
    }

    // Synthetic prices stay within a few percent of the reference
    {
        for (int64_t step = 0; step < 2000; ++step) {
            const double p = feed::SimulatedPriceFeed::syntheticPrice(100.0, step);
            assert(p > 98.0 && p < 102.0);
        }
        assert(feed::SimulatedPriceFeed::syntheticPrice(100.0, 0) == 100.0);
    }

    // Backfill then live ticks
    {
        engine::FeedConfig config;
        config.interval_ms = 10;
        config.backfill_points = 50;
        config.assets = {{"BTC", 50000.0}, {"ETH", 3000.0}};

        market::PriceHistoryStore store(1000);
        feed::SimulatedPriceFeed feed(store, config);
        feed.backfill();
        assert(store.snapshot("BTC", 1000).size() == 50);
        assert(store.snapshot("ETH", 1000).size() == 50);

        feed.start();
        assert(feed.isRunning());
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (store.snapshot("BTC", 1000).size() < 55 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        feed.stop();
        assert(!feed.isRunning());

        const size_t count = store.snapshot("BTC", 1000).size();
        assert(count >= 55);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(store.snapshot("BTC", 1000).size() == count);

        // Manual ticks never go backwards in time
        const long long newest = *store.newestTimestamp("BTC");
        feed.tick(0);
        assert(*store.newestTimestamp("BTC") == newest + 1);
    }

    std::cout << "[TEST] PriceFeed Test PASSED!" << std::endl;
    return 0;
}
