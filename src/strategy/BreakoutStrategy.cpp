#include "strategy/BreakoutStrategy.h"
#include "common/Logger.h"
#include <cstdio>
#include <string>

namespace daypilot {
namespace strategy {

namespace {
bool missingLevel(const std::optional<double>& level) {
    return !level || *level == 0.0;
}
}

// ===== Constructor =====

BreakoutStrategy::BreakoutStrategy(BreakoutStrategyConfig config, MarketClock clock)
    : config_(config)
    , clock_(clock)
{}

StrategyInfo BreakoutStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "BREAKOUT";
    info.description = "Opening range breakout confirmed by the previous candle";
    return info;
}

bool BreakoutStrategy::insideTradingWindow(TimestampMs ts) const {
    const int second = clock_.toLocal(ts).second_of_day;
    return second >= config_.window_start * 60 && second <= config_.window_end * 60;
}

// ===== Evaluation =====

TradeDecision BreakoutStrategy::evaluateBar(const std::vector<IndicatorBar>& bars, size_t index) const {
    const IndicatorBar& bar = bars[index];
    const Candle& c = bar.candle;

    if (!insideTradingWindow(bar.time())) {
        return TradeDecision::rejected(kind(), "Outside trading window");
    }

    if (config_.candle.isWeak(c)) {
        return TradeDecision::rejected(kind(), "Weak candle " + std::to_string(c.close));
    }

    if (!bar.atr || *bar.atr < config_.min_atr) {
        char buffer[96];
        if (bar.atr) {
            std::snprintf(buffer, sizeof(buffer), "ATR %.2f < %.0f", *bar.atr, config_.min_atr);
        } else {
            std::snprintf(buffer, sizeof(buffer), "ATR missing");
        }
        return TradeDecision::rejected(kind(), buffer);
    }

    if (missingLevel(bar.breakout_long_entry) || missingLevel(bar.breakout_short_entry) ||
        missingLevel(bar.breakout_stop_distance) || missingLevel(bar.breakout_target_distance)) {
        return TradeDecision::rejected(kind(), "Missing breakout levels");
    }

    const bool prev_bullish = bar.close_prev_1 && bar.open_prev_1 && *bar.close_prev_1 > *bar.open_prev_1;
    const bool prev_bearish = bar.close_prev_1 && bar.open_prev_1 && *bar.close_prev_1 < *bar.open_prev_1;

    const double entry = c.close;
    const double stop_distance = *bar.breakout_stop_distance;
    const double target_distance = *bar.breakout_target_distance;

    // --- LONG ---
    if (c.high >= *bar.breakout_long_entry && prev_bullish) {
        return TradeDecision::valid(Direction::BUY, entry, entry - stop_distance, entry + target_distance,
                                    kind(), bar.time());
    }

    // --- SHORT ---
    if (c.low <= *bar.breakout_short_entry && prev_bearish) {
        return TradeDecision::valid(Direction::SELL, entry, entry + stop_distance, entry - target_distance,
                                    kind(), bar.time());
    }

    return TradeDecision::rejected(kind(), "No breakout conditions met");
}

} // namespace strategy
} // namespace daypilot
