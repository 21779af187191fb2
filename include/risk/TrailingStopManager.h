#pragma once

#include "risk/TradeState.h"
#include <optional>

namespace daypilot {
namespace risk {

struct TrailingStopConfig {
    long long min_age_seconds = 120;        // no trailing before this
    double near_target_atr = 0.25;          // "near target" band in ATRs
    double near_target_offset = 30.0;       // stop distance once near target
    double trigger_move_atr = 1.0;          // favorable move needed to trail
    double natural_atr_mult = 0.6;
    long long aged_seconds = 1800;
    double aged_fallback_cap = 50.0;        // fallback distance cap after aged_seconds
    double min_change = 0.01;
};

// Moves the stop of an open trade towards the price. A stop never moves
// against the position: BUY stops only rise, SELL stops only fall.
class TrailingStopManager {
public:
    explicit TrailingStopManager(TrailingStopConfig config = TrailingStopConfig());

    // Returns the new stop when it changed. Sets stop_loss and last_sl_update_time.
    std::optional<double> update(TradeState& state, double price, double atr, TimestampMs now) const;

    const TrailingStopConfig& config() const { return config_; }

private:
    std::optional<double> candidateStop(const TradeState& state, double price, double atr,
                                        long long age_seconds) const;
    bool isImprovement(const TradeState& state, double candidate) const;

    TrailingStopConfig config_;
};

} // namespace risk
} // namespace daypilot
