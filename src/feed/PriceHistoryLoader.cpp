#include "feed/PriceHistoryLoader.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace tradebots {
namespace feed {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}
}

std::vector<PricePoint> PriceHistoryLoader::loadCSV(const std::string& file_path) {
    std::vector<PricePoint> points;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return points;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 3 || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row
            continue;
        }

        try {
            PricePoint point(std::stoll(row[0]), row[1], std::stod(row[2]));
            if (point.asset.empty() || !std::isfinite(point.price) || point.price <= 0.0) {
                LOG_WARN("Skipping invalid price row: {}", line);
                continue;
            }
            points.push_back(std::move(point));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} price points from {}", points.size(), file_path);
    return points;
}

size_t PriceHistoryLoader::backfill(market::PriceHistoryStore& store, std::vector<PricePoint> points) {
    std::stable_sort(points.begin(), points.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.timestamp_ms < b.timestamp_ms;
    });

    size_t accepted = 0;
    for (const auto& point : points) {
        if (store.append(point)) {
            accepted++;
        }
    }
    return accepted;
}

} // namespace feed
} // namespace tradebots
