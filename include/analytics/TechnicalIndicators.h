#pragma once

#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "common/MarketClock.h"
#include "common/Types.h"

namespace daypilot {
namespace analytics {

class TechnicalIndicators {
public:
    static constexpr int kEmaShortSpan = 5;
    static constexpr int kEmaLongSpan = 20;
    static constexpr int kMacdFastSpan = 12;
    static constexpr int kMacdSlowSpan = 26;
    static constexpr int kRsiWindow = 14;
    static constexpr int kAtrWindow = 14;

    // Builds one IndicatorBar per valid candle, in input order. Rows with a
    // non-positive timestamp are dropped. Throws DataError when nothing remains.
    // Strategy level fields are left empty.
    static std::vector<IndicatorBar> addTechnicalIndicators(const std::vector<Candle>& candles);

    // EMA with alpha = 2 / (span + 1), seeded with the first value (no SMA warm-up)
    static std::vector<double> calculateEMAVector(const std::vector<double>& values, int span);

    // Trailing mean over `window` values; empty until the window is full
    static std::vector<std::optional<double>> rollingMean(const std::vector<std::optional<double>>& values,
                                                          int window);

    // 100 - 100 / (1 + mean(close_t / close_t-1)) over the window
    static std::vector<std::optional<double>> calculateRSISeries(const std::vector<double>& closes,
                                                                 int window = kRsiWindow);

    // Mean of (high - low) over the window
    static std::vector<std::optional<double>> calculateATRSeries(const std::vector<Candle>& candles,
                                                                 int window = kAtrWindow);

    // Parses [{date, open, high, low, close, volume}, ...]. Rows with an
    // unparseable date keep timestamp 0 and are dropped later. Output is sorted
    // by time with duplicate timestamps removed (first wins).
    static std::vector<Candle> jsonToCandles(const nlohmann::json& json_candles, const MarketClock& clock);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace daypilot
