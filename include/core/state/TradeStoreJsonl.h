#pragma once

#include <filesystem>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/MarketClock.h"
#include "core/contracts/ITradeStore.h"

namespace daypilot {
namespace core {

// trades.jsonl holds every TradeRecord row; trade_log.jsonl receives the
// daily summary rows written by populateDailyLog.
class TradeStoreJsonl : public ITradeStore {
public:
    TradeStoreJsonl(std::filesystem::path directory, MarketClock clock, bool truncate_on_start);

    bool recordTrade(const TradeRecord& record) override;
    double fetchPnlToday(int today) override;
    bool populateDailyLog(int today) override;
    TradeSummary fetchSummary() override;

    std::vector<TradeRecord> readAll() const;

    const std::filesystem::path& tradesPath() const { return trades_path_; }
    const std::filesystem::path& dailyLogPath() const { return daily_log_path_; }

private:
    nlohmann::json toJson(const TradeRecord& record) const;
    TradeRecord fromJson(const nlohmann::json& line) const;
    std::vector<TradeRecord> readAllLocked() const;

    std::filesystem::path trades_path_;
    std::filesystem::path daily_log_path_;
    MarketClock clock_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace daypilot
