#pragma once

#include "common/MarketClock.h"
#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace daypilot {
namespace data {

// Bars returned by any source are time-ordered with unique timestamps.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    // Throws DataError on a malformed/empty payload, ExternalCallError on transport failure
    virtual std::vector<Candle> fetchBars(const std::string& symbol,
                                          const std::string& interval,
                                          int lookback_days) = 0;
};

// Shared normalization: parse, sort, dedupe, then keep only the last
// `lookback_days` days counted back from the newest bar.
std::vector<Candle> parseCandlePayload(const nlohmann::json& payload, const MarketClock& clock,
                                       int lookback_days);

} // namespace data
} // namespace daypilot
