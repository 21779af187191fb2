#pragma once

#include "common/Errors.h"
#include "common/Retry.h"
#include "common/MarketClock.h"
#include "common/Types.h"
#include "core/contracts/ITradeStore.h"
#include "data/IMarketDataSource.h"
#include "execution/IBrokerGateway.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace daypilot {
namespace test {

inline const MarketClock& ist() {
    static const MarketClock clock(330);
    return clock;
}

// 2024-01-15 is a Monday
inline TimestampMs at(int hour, int minute, int day = 15, int second = 0) {
    return ist().fromLocal(2024, 1, day, hour, minute, second);
}

inline IndicatorBar makeBar(TimestampMs ts, double open, double high, double low, double close,
                            double volume = 1000.0) {
    IndicatorBar bar;
    bar.candle = Candle(open, high, low, close, volume, ts);
    bar.typical_price = (high + low + close) / 3.0;
    return bar;
}

// 5-minute candles for one day starting at 09:15
inline std::vector<Candle> sessionCandles(int day, int count, double start_price, double step,
                                          double range = 30.0, double volume = 1000.0) {
    std::vector<Candle> out;
    double price = start_price;
    for (int i = 0; i < count; ++i) {
        const int minute = 9 * 60 + 15 + i * 5;
        const double open = price;
        const double close = price + step;
        const double high = std::max(open, close) + range / 2.0;
        const double low = std::min(open, close) - range / 2.0;
        out.emplace_back(open, high, low, close, volume, at(minute / 60, minute % 60, day));
        price = close;
    }
    return out;
}

class InMemoryTradeStore : public core::ITradeStore {
public:
    bool recordTrade(const core::TradeRecord& record) override {
        ++write_calls;
        if (fail_writes) return false;
        if (failures_remaining > 0) {
            --failures_remaining;
            return false;
        }
        rows.push_back(record);
        return true;
    }

    double fetchPnlToday(int today) override {
        double total = preset_pnl_today;
        for (const auto& row : rows) {
            if (ist().localDate(row.time) == today) total += row.pnl;
        }
        return total;
    }

    bool populateDailyLog(int) override {
        ++daily_log_calls;
        return true;
    }

    core::TradeSummary fetchSummary() override {
        core::TradeSummary summary;
        for (const auto& row : rows) {
            if (!row.exited) continue;
            ++summary.total_trades;
            summary.total_pnl += row.pnl;
        }
        return summary;
    }

    int countNotes(const std::string& notes) const {
        int n = 0;
        for (const auto& row : rows) {
            if (row.notes == notes) ++n;
        }
        return n;
    }

    std::vector<core::TradeRecord> rows;
    double preset_pnl_today = 0.0;
    bool fail_writes = false;       // every write fails
    int failures_remaining = 0;     // the next N writes fail
    int write_calls = 0;
    int daily_log_calls = 0;
};

class RecordingBroker : public execution::IBrokerGateway {
public:
    double getAvailableMargin() override {
        if (margin_unavailable) throw ExternalCallError("margin endpoint down");
        return margin;
    }

    std::string placeMarketOrder(const execution::MarketOrderRequest& request) override {
        ++order_calls;
        if (reject_market_orders) throw ExternalCallError("market order rejected");
        failIfScripted();
        market_orders.push_back(request);
        return "MKT-" + std::to_string(market_orders.size());
    }

    std::string submitStopOrder(const execution::StopOrderRequest& request) override {
        ++order_calls;
        if (reject_stop_orders) throw ExternalCallError("stop order rejected");
        failIfScripted();
        stop_orders.push_back(request);
        return "STOP-" + std::to_string(stop_orders.size());
    }

    void modifyStopOrder(const std::string& order_id, double trigger_price) override {
        ++order_calls;
        failIfScripted();
        modifications.emplace_back(order_id, trigger_price);
    }

    void cancelOrder(const std::string& order_id) override {
        ++order_calls;
        failIfScripted();
        cancels.push_back(order_id);
    }

    double margin = 250000.0;
    bool margin_unavailable = false;
    bool reject_market_orders = false;
    bool reject_stop_orders = false;
    int failures_remaining = 0;     // the next N order calls of any kind fail
    int order_calls = 0;

    std::vector<execution::MarketOrderRequest> market_orders;
    std::vector<execution::StopOrderRequest> stop_orders;
    std::vector<std::pair<std::string, double>> modifications;
    std::vector<std::string> cancels;

private:
    void failIfScripted() {
        if (failures_remaining > 0) {
            --failures_remaining;
            throw ExternalCallError("broker timeout");
        }
    }
};

// Records requested delays instead of sleeping
struct RecordingSleeper {
    std::vector<long long> delays_ms;

    Sleeper fn() {
        return [this](std::chrono::milliseconds d) { delays_ms.push_back(d.count()); };
    }
};

class ScriptedMarketData : public data::IMarketDataSource {
public:
    std::vector<Candle> fetchBars(const std::string&, const std::string&, int) override {
        ++calls;
        if (failures_remaining > 0) {
            --failures_remaining;
            throw ExternalCallError("simulator unreachable");
        }
        return candles;
    }

    std::vector<Candle> candles;
    int failures_remaining = 0;
    int calls = 0;
};

} // namespace test
} // namespace daypilot
