#include "data/FileMarketData.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <fstream>

namespace daypilot {
namespace data {

FileMarketData::FileMarketData(std::filesystem::path file_path, MarketClock clock)
    : file_path_(std::move(file_path))
    , clock_(clock)
{}

std::vector<Candle> FileMarketData::fetchBars(const std::string& symbol,
                                              const std::string& interval,
                                              int lookback_days) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw ExternalCallError("cannot open replay file: " + file_path_.string());
    }

    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& e) {
        throw DataError("replay file is not valid JSON: " + std::string(e.what()));
    }

    auto candles = parseCandlePayload(payload, clock_, lookback_days);
    LOG_DEBUG("Replay file returned {} {} bars for {}", candles.size(), interval, symbol);
    return candles;
}

} // namespace data
} // namespace daypilot
