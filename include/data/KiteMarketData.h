#pragma once

#include "data/IMarketDataSource.h"
#include "network/IHttpClient.h"
#include "network/KiteSession.h"
#include <functional>
#include <map>
#include <memory>

namespace daypilot {
namespace data {

// Kite Connect historical candles. The instrument token is looked up once per
// symbol through the LTP quote, then bars come from
// GET /instruments/historical/{token}/{interval}?from=&to=
class KiteMarketData : public IMarketDataSource {
public:
    using NowFn = std::function<TimestampMs()>;

    KiteMarketData(std::shared_ptr<network::IHttpClient> client,
                   const network::KiteCredentials& credentials,
                   std::string exchange,
                   MarketClock clock,
                   NowFn now = &MarketClock::nowMs);

    std::vector<Candle> fetchBars(const std::string& symbol,
                                  const std::string& interval,
                                  int lookback_days) override;

    // "YYYY-MM-DD HH:MM:SS" in exchange time
    std::string formatQueryTime(TimestampMs ts) const;

private:
    long long instrumentToken(const std::string& symbol);

    std::shared_ptr<network::IHttpClient> client_;
    std::string exchange_;
    MarketClock clock_;
    NowFn now_;
    std::map<std::string, long long> tokens_;
};

} // namespace data
} // namespace daypilot
