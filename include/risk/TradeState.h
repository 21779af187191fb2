#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace daypilot {
namespace risk {

// The single position record. Written only by PositionManager and
// TrailingStopManager; at most one trade is open at any time.
struct TradeState {
    Direction direction;
    double entry_price;
    TimestampMs entry_time;         // when the position was opened
    TimestampMs entry_bar_time;     // bar that produced the entry signal
    double stop_loss;
    double target_price;
    bool open;
    StrategyKind strategy;
    std::string trade_id;
    int quantity;
    int lots;
    bool checked_post_entry;
    std::optional<TimestampMs> last_sl_update_time;
    std::string stop_order_id;      // working broker stop, empty when none

    // Survive reset(); they seed cooldown and re-entry checks
    std::optional<TimestampMs> last_exit_time;
    std::optional<double> last_exit_price;

    TradeState()
        : direction(Direction::NONE)
        , entry_price(0.0)
        , entry_time(0)
        , entry_bar_time(0)
        , stop_loss(0.0)
        , target_price(0.0)
        , open(false)
        , strategy(StrategyKind::REVERSION)
        , quantity(0)
        , lots(0)
        , checked_post_entry(false)
    {}

    // Clears the position fields, keeping last exit time/price
    void reset() {
        const auto exit_time = last_exit_time;
        const auto exit_price = last_exit_price;
        *this = TradeState();
        last_exit_time = exit_time;
        last_exit_price = exit_price;
    }
};

} // namespace risk
} // namespace daypilot
