#include "analytics/IndicatorSnapshot.h"
#include "analytics/TechnicalIndicators.h"
#include <cctype>
#include <cmath>

namespace tradebots {
namespace analytics {

namespace {

enum class IndicatorKind { SMA, EMA, RSI, MACD, MACD_SIGNAL, MACD_HIST, UNKNOWN };

struct ParsedIndicator {
    IndicatorKind kind = IndicatorKind::UNKNOWN;
    int period = 0;
};

bool parsePeriod(const std::string& digits, int& out) {
    if (digits.empty() || digits.size() > 6) {
        return false;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    out = std::stoi(digits);
    return out > 0;
}

ParsedIndicator parse(const std::string& id) {
    ParsedIndicator parsed;
    if (id == "macd") { parsed.kind = IndicatorKind::MACD; return parsed; }
    if (id == "macd_signal") { parsed.kind = IndicatorKind::MACD_SIGNAL; return parsed; }
    if (id == "macd_hist") { parsed.kind = IndicatorKind::MACD_HIST; return parsed; }

    const auto sep = id.find('_');
    if (sep == std::string::npos) {
        return parsed;
    }
    const std::string name = id.substr(0, sep);
    int period = 0;
    if (!parsePeriod(id.substr(sep + 1), period)) {
        return parsed;
    }

    if (name == "sma") parsed.kind = IndicatorKind::SMA;
    else if (name == "ema") parsed.kind = IndicatorKind::EMA;
    else if (name == "rsi") parsed.kind = IndicatorKind::RSI;
    parsed.period = period;
    return parsed;
}

std::optional<double> lastDefined(const std::vector<double>& series) {
    if (series.empty() || std::isnan(series.back())) {
        return std::nullopt;
    }
    return series.back();
}

} // namespace

IndicatorValues IndicatorSnapshot::compute(const std::vector<double>& prices,
                                           const std::vector<std::string>& requested) {
    IndicatorValues values;

    // MACD lines share one computation
    std::optional<TechnicalIndicators::MACDSeries> macd;

    for (const auto& id : requested) {
        const auto parsed = parse(id);
        switch (parsed.kind) {
            case IndicatorKind::SMA:
                values[id] = lastDefined(TechnicalIndicators::calculateSMA(prices, parsed.period));
                break;
            case IndicatorKind::EMA:
                values[id] = lastDefined(TechnicalIndicators::calculateEMA(prices, parsed.period));
                break;
            case IndicatorKind::RSI:
                values[id] = lastDefined(TechnicalIndicators::calculateRSI(prices, parsed.period));
                break;
            case IndicatorKind::MACD:
            case IndicatorKind::MACD_SIGNAL:
            case IndicatorKind::MACD_HIST:
                if (!macd) {
                    macd = TechnicalIndicators::calculateMACD(prices);
                }
                if (parsed.kind == IndicatorKind::MACD) values[id] = lastDefined(macd->macd);
                else if (parsed.kind == IndicatorKind::MACD_SIGNAL) values[id] = lastDefined(macd->signal);
                else values[id] = lastDefined(macd->histogram);
                break;
            case IndicatorKind::UNKNOWN:
                values[id] = std::nullopt;
                break;
        }
    }
    return values;
}

IndicatorValues IndicatorSnapshot::compute(const std::vector<PricePoint>& points,
                                           const std::vector<std::string>& requested) {
    return compute(extractPrices(points), requested);
}

bool IndicatorSnapshot::isKnownIndicator(const std::string& id) {
    return parse(id).kind != IndicatorKind::UNKNOWN;
}

std::vector<double> IndicatorSnapshot::extractPrices(const std::vector<PricePoint>& points) {
    std::vector<double> prices;
    prices.reserve(points.size());
    for (const auto& p : points) {
        prices.push_back(p.price);
    }
    return prices;
}

} // namespace analytics
} // namespace tradebots
