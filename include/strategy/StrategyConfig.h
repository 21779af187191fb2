#pragma once

#include "common/Types.h"

namespace daypilot {
namespace strategy {

enum class StrategyMode {
    ADAPTIVE,   // classify every day from its opening range
    FIXED       // always use fixed_strategy
};

// A candle is weak when its range is tiny or its body is small against the range.
struct CandleQuality {
    double min_range = 5.0;
    double min_body_ratio = 0.25;

    bool isWeak(const Candle& c) const {
        const double range = c.range();
        return range < min_range || c.body() < min_body_ratio * range;
    }
};

struct SelectorConfig {
    StrategyMode mode = StrategyMode::ADAPTIVE;
    StrategyKind fixed_strategy = StrategyKind::BREAKOUT;
    int opening_range_start = 9 * 60 + 15;   // minutes after local midnight
    int opening_range_end = 9 * 60 + 30;
    double min_opening_range = 25.0;         // high-low span floor
    double breakout_volatility_threshold = 15.0;
};

struct BreakoutStrategyConfig {
    double entry_buffer = 5.0;
    double sl_factor = 1.5;
    double target_factor = 4.0;
    double min_stop_distance = 20.0;
    double default_atr = 20.0;               // used while ATR is still warming up
    double min_atr = 10.0;
    int window_start = 9 * 60 + 30;
    int window_end = 15 * 60 + 25;
    CandleQuality candle;
};

struct ReversionStrategyConfig {
    double deviation = 0.001;                // band half-width as a fraction of price
    double sl_mult = 0.8;                    // stop distance in ATRs
    double target_mult = 4.0;                // target distance in ATRs
    double rr_threshold = 1.2;
    double min_atr = 5.0;
    double min_atr_ratio = 0.0001;           // ATR / price
    CandleQuality candle;
};

struct FilterConfig {
    int volume_window = 14;
    double volume_multiplier = 1.2;
    int momentum_bars = 3;
    double reentry_atr_fraction = 0.5;
    long long cooldown_seconds = 15 * 60;
    CandleQuality candle;
};

struct StrategyConfig {
    SelectorConfig selector;
    BreakoutStrategyConfig breakout;
    ReversionStrategyConfig reversion;
    FilterConfig filters;
};

} // namespace strategy
} // namespace daypilot
