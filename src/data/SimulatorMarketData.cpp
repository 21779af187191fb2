#include "data/SimulatorMarketData.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace daypilot {
namespace data {

SimulatorMarketData::SimulatorMarketData(std::shared_ptr<network::IHttpClient> client, MarketClock clock)
    : client_(std::move(client))
    , clock_(clock)
{}

std::vector<Candle> SimulatorMarketData::fetchBars(const std::string& symbol,
                                                   const std::string& interval,
                                                   int lookback_days) {
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    params["interval"] = interval;

    const auto response = client_->get("/historical_data", params);
    if (!response.isSuccess()) {
        throw ExternalCallError("Simulator error: HTTP " + std::to_string(response.status_code));
    }

    nlohmann::json payload;
    try {
        payload = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw DataError(std::string("Simulator returned invalid JSON: ") + e.what());
    }

    auto candles = parseCandlePayload(payload, clock_, lookback_days);
    LOG_DEBUG("Simulator returned {} bars for {}", candles.size(), symbol);
    return candles;
}

} // namespace data
} // namespace daypilot
