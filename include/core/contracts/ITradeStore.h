#pragma once

#include "common/Types.h"
#include <string>

namespace daypilot {
namespace core {

// One persisted row. Entries, trailing-stop updates and exits each append a row.
struct TradeRecord {
    std::string trade_id;
    TimestampMs time = 0;               // entry time
    Direction type = Direction::NONE;
    double price = 0.0;                 // entry price
    double sl = 0.0;
    bool exited = false;
    double pnl = 0.0;
    std::string strategy;
    std::string source = "PositionManager";
    std::string notes;
    std::string symbol;
    double exit_price = 0.0;
    TimestampMs exit_time = 0;          // row write time for non-exit rows
    int lots = 0;
};

struct TradeSummary {
    int total_trades = 0;
    double total_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double win_pct = 0.0;
};

// Failures are reported through return values; callers log and continue.
class ITradeStore {
public:
    virtual ~ITradeStore() = default;

    virtual bool recordTrade(const TradeRecord& record) = 0;

    // Sum of pnl over rows whose entry falls on `today` (YYYYMMDD, exchange local)
    virtual double fetchPnlToday(int today) = 0;

    // Copies today's exited trades into the daily trade log
    virtual bool populateDailyLog(int today) = 0;

    virtual TradeSummary fetchSummary() = 0;
};

} // namespace core
} // namespace daypilot
