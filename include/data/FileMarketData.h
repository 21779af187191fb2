#pragma once

#include "data/IMarketDataSource.h"
#include <filesystem>

namespace daypilot {
namespace data {

// Reads the same JSON array the simulator serves from a local file. The file
// is re-read on every fetch so an external writer can append to it.
class FileMarketData : public IMarketDataSource {
public:
    FileMarketData(std::filesystem::path file_path, MarketClock clock);

    std::vector<Candle> fetchBars(const std::string& symbol,
                                  const std::string& interval,
                                  int lookback_days) override;

private:
    std::filesystem::path file_path_;
    MarketClock clock_;
};

} // namespace data
} // namespace daypilot
