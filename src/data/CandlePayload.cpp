#include "data/IMarketDataSource.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <algorithm>

namespace daypilot {
namespace data {

std::vector<Candle> parseCandlePayload(const nlohmann::json& payload, const MarketClock& clock,
                                       int lookback_days) {
    if (!payload.is_array() || payload.empty()) {
        throw DataError("market data payload is empty or not an array");
    }

    auto candles = analytics::TechnicalIndicators::jsonToCandles(payload, clock);

    if (lookback_days > 0 && !candles.empty() && candles.back().timestamp > 0) {
        const TimestampMs horizon = candles.back().timestamp - static_cast<TimestampMs>(lookback_days) * 86400000LL;
        candles.erase(std::remove_if(candles.begin(), candles.end(),
                                     [horizon](const Candle& c) {
                                         return c.timestamp > 0 && c.timestamp < horizon;
                                     }),
                      candles.end());
    }
    return candles;
}

} // namespace data
} // namespace daypilot
