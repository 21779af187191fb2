#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace daypilot {
namespace analytics {

std::vector<IndicatorBar> TechnicalIndicators::addTechnicalIndicators(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        throw DataError("no candles to compute indicators on");
    }

    std::vector<Candle> valid;
    valid.reserve(candles.size());
    for (const auto& c : candles) {
        if (c.timestamp > 0) {
            valid.push_back(c);
        }
    }
    if (valid.empty()) {
        throw DataError("no candles with a resolvable timestamp");
    }
    if (valid.size() != candles.size()) {
        LOG_WARN("Dropped {} candles with unresolved timestamps", candles.size() - valid.size());
    }

    const auto closes = extractClosePrices(valid);
    const auto ema_short = calculateEMAVector(closes, kEmaShortSpan);
    const auto ema_long = calculateEMAVector(closes, kEmaLongSpan);
    const auto ema_fast = calculateEMAVector(closes, kMacdFastSpan);
    const auto ema_slow = calculateEMAVector(closes, kMacdSlowSpan);
    const auto rsi = calculateRSISeries(closes);
    const auto atr = calculateATRSeries(valid);

    std::vector<IndicatorBar> bars;
    bars.reserve(valid.size());
    for (size_t i = 0; i < valid.size(); ++i) {
        IndicatorBar bar;
        const auto& c = valid[i];
        bar.candle = c;
        bar.ema_short = ema_short[i];
        bar.ema_long = ema_long[i];
        bar.macd = ema_fast[i] - ema_slow[i];
        bar.typical_price = (c.high + c.low + c.close) / 3.0;
        bar.rsi = rsi[i];
        bar.atr = atr[i];
        if (i >= 1) {
            bar.open_prev_1 = valid[i - 1].open;
            bar.close_prev_1 = valid[i - 1].close;
        }
        if (i >= 2) {
            bar.open_prev_2 = valid[i - 2].open;
            bar.close_prev_2 = valid[i - 2].close;
        }
        bars.push_back(bar);
    }
    return bars;
}

std::vector<double> TechnicalIndicators::calculateEMAVector(const std::vector<double>& values, int span) {
    std::vector<double> ema_values;
    if (values.empty() || span <= 0) return ema_values;

    const double alpha = 2.0 / (span + 1.0);
    ema_values.reserve(values.size());

    double ema = values.front();
    ema_values.push_back(ema);
    for (size_t i = 1; i < values.size(); ++i) {
        ema = alpha * values[i] + (1.0 - alpha) * ema;
        ema_values.push_back(ema);
    }
    return ema_values;
}

std::vector<std::optional<double>> TechnicalIndicators::rollingMean(
    const std::vector<std::optional<double>>& values,
    int window
) {
    std::vector<std::optional<double>> out(values.size());
    if (window <= 0) return out;

    for (size_t i = 0; i < values.size(); ++i) {
        if (i + 1 < static_cast<size_t>(window)) continue;

        double sum = 0.0;
        bool complete = true;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            if (!values[k]) {
                complete = false;
                break;
            }
            sum += *values[k];
        }
        if (complete) {
            out[i] = sum / window;
        }
    }
    return out;
}

std::vector<std::optional<double>> TechnicalIndicators::calculateRSISeries(
    const std::vector<double>& closes,
    int window
) {
    // Growth factor close_t / close_t-1; undefined for the first bar or a zero base
    std::vector<std::optional<double>> growth(closes.size());
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] != 0.0) {
            growth[i] = closes[i] / closes[i - 1];
        }
    }

    auto mean_growth = rollingMean(growth, window);
    std::vector<std::optional<double>> rsi(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        if (mean_growth[i]) {
            rsi[i] = 100.0 - 100.0 / (1.0 + *mean_growth[i]);
        }
    }
    return rsi;
}

std::vector<std::optional<double>> TechnicalIndicators::calculateATRSeries(
    const std::vector<Candle>& candles,
    int window
) {
    std::vector<std::optional<double>> ranges;
    ranges.reserve(candles.size());
    for (const auto& c : candles) {
        ranges.emplace_back(c.high - c.low);
    }
    return rollingMean(ranges, window);
}

std::vector<Candle> TechnicalIndicators::jsonToCandles(const nlohmann::json& json_candles,
                                                       const MarketClock& clock) {
    if (!json_candles.is_array()) {
        throw DataError("candle payload is not a JSON array");
    }

    auto getDouble = [](const nlohmann::json& row, const char* key) -> double {
        auto it = row.find(key);
        if (it == row.end() || it->is_null()) {
            throw DataError(std::string("candle is missing '") + key + "'");
        }
        if (it->is_number()) {
            return it->get<double>();
        }
        if (it->is_string()) {
            const auto text = it->get<std::string>();
            try {
                size_t used = 0;
                const double value = std::stod(text, &used);
                if (used == text.size()) return value;
            } catch (const std::exception&) {
            }
        }
        throw DataError(std::string("candle field '") + key + "' is not numeric");
    };

    std::vector<Candle> candles;
    candles.reserve(json_candles.size());
    for (const auto& jc : json_candles) {
        if (!jc.is_object()) {
            throw DataError("candle row is not an object");
        }
        Candle c;
        c.open = getDouble(jc, "open");
        c.high = getDouble(jc, "high");
        c.low = getDouble(jc, "low");
        c.close = getDouble(jc, "close");
        c.volume = getDouble(jc, "volume");

        auto date = jc.find("date");
        if (date != jc.end() && date->is_string()) {
            c.timestamp = clock.parseTimestamp(date->get<std::string>()).value_or(0);
        } else if (date != jc.end() && date->is_number_integer()) {
            c.timestamp = date->get<long long>();
        }
        candles.push_back(c);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) {
                         return a.timestamp < b.timestamp;
                     });
    candles.erase(std::unique(candles.begin(), candles.end(),
                              [](const Candle& a, const Candle& b) {
                                  return a.timestamp == b.timestamp && a.timestamp > 0;
                              }),
                  candles.end());
    return candles;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

} // namespace analytics
} // namespace daypilot
