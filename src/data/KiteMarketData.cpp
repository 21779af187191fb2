#include "data/KiteMarketData.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace daypilot {
namespace data {

KiteMarketData::KiteMarketData(std::shared_ptr<network::IHttpClient> client,
                               const network::KiteCredentials& credentials,
                               std::string exchange,
                               MarketClock clock,
                               NowFn now)
    : client_(std::move(client))
    , exchange_(std::move(exchange))
    , clock_(clock)
    , now_(std::move(now))
{
    if (!now_) {
        now_ = &MarketClock::nowMs;
    }
    network::authorizeKiteClient(*client_, credentials);
}

std::string KiteMarketData::formatQueryTime(TimestampMs ts) const {
    std::string text = clock_.formatIso(ts).substr(0, 19);
    text[10] = ' ';
    return text;
}

long long KiteMarketData::instrumentToken(const std::string& symbol) {
    auto cached = tokens_.find(symbol);
    if (cached != tokens_.end()) {
        return cached->second;
    }

    const std::string key = exchange_ + ":" + symbol;
    std::map<std::string, std::string> params;
    params["i"] = key;
    const auto data = network::parseKiteEnvelope(client_->get("/quote/ltp", params), "LTP lookup");

    long long token = 0;
    try {
        token = data.at(key).at("instrument_token").get<long long>();
    } catch (const nlohmann::json::exception& e) {
        throw DataError("no instrument token for " + key + ": " + e.what());
    }
    tokens_[symbol] = token;
    LOG_INFO("Instrument token for {}: {}", key, token);
    return token;
}

std::vector<Candle> KiteMarketData::fetchBars(const std::string& symbol,
                                              const std::string& interval,
                                              int lookback_days) {
    const long long token = instrumentToken(symbol);
    const TimestampMs to = now_();
    const TimestampMs from = to - static_cast<TimestampMs>(lookback_days) * 86400000LL;

    std::map<std::string, std::string> params;
    params["from"] = formatQueryTime(from);
    params["to"] = formatQueryTime(to);
    const auto data = network::parseKiteEnvelope(
        client_->get("/instruments/historical/" + std::to_string(token) + "/" + interval, params),
        "Historical data");

    // Rows arrive as [date, open, high, low, close, volume]
    nlohmann::json payload = nlohmann::json::array();
    auto rows = data.find("candles");
    if (rows == data.end() || !rows->is_array()) {
        throw DataError("historical response has no candles array");
    }
    for (const auto& row : *rows) {
        if (!row.is_array() || row.size() < 6) {
            throw DataError("historical candle row is malformed");
        }
        payload.push_back({{"date", row[0]}, {"open", row[1]}, {"high", row[2]},
                           {"low", row[3]}, {"close", row[4]}, {"volume", row[5]}});
    }

    auto candles = parseCandlePayload(payload, clock_, lookback_days);
    LOG_DEBUG("Kite returned {} bars for {}", candles.size(), symbol);
    return candles;
}

} // namespace data
} // namespace daypilot
