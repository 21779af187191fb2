#pragma once

#include "data/IMarketDataSource.h"
#include "network/IHttpClient.h"
#include <memory>

namespace daypilot {
namespace data {

// Local replay server: GET /historical_data?symbol=&interval=
class SimulatorMarketData : public IMarketDataSource {
public:
    SimulatorMarketData(std::shared_ptr<network::IHttpClient> client, MarketClock clock);

    std::vector<Candle> fetchBars(const std::string& symbol,
                                  const std::string& interval,
                                  int lookback_days) override;

private:
    std::shared_ptr<network::IHttpClient> client_;
    MarketClock clock_;
};

} // namespace data
} // namespace daypilot
