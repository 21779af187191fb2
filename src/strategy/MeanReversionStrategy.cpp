#include "strategy/MeanReversionStrategy.h"
#include "common/Logger.h"
#include <cstdio>
#include <string>

namespace daypilot {
namespace strategy {

MeanReversionStrategy::MeanReversionStrategy(ReversionStrategyConfig config)
    : config_(config)
{}

StrategyInfo MeanReversionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "REVERSION";
    info.description = "Typical price band cross with long EMA trend filter";
    return info;
}

TradeDecision MeanReversionStrategy::evaluateBar(const std::vector<IndicatorBar>& bars, size_t index) const {
    const IndicatorBar& bar = bars[index];
    const Candle& c = bar.candle;
    const double entry = c.close;

    if (config_.candle.isWeak(c)) {
        return TradeDecision::rejected(kind(), "Weak candle " + std::to_string(entry));
    }

    if (!bar.atr) {
        return TradeDecision::rejected(kind(), "Missing entry or ATR");
    }

    if (!bar.rsi || !bar.close_prev_1) {
        return TradeDecision::rejected(kind(), "Missing indicator value(s)");
    }

    const double atr = *bar.atr;
    if (entry <= 0.0 || atr / entry < config_.min_atr_ratio || atr < config_.min_atr) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "ATR too low %.2f < %.0f", atr, config_.min_atr);
        return TradeDecision::rejected(kind(), buffer);
    }

    const double prev_close = *bar.close_prev_1;
    const double upper = bar.typical_price + config_.deviation * entry;
    const double lower = bar.typical_price - config_.deviation * entry;

    if (entry > upper && prev_close <= upper && entry > bar.ema_long) {
        return checkRiskReward(Direction::BUY, entry,
                               entry - config_.sl_mult * atr,
                               entry + config_.target_mult * atr,
                               bar.time());
    }

    if (entry < lower && prev_close >= lower && entry < bar.ema_long) {
        return checkRiskReward(Direction::SELL, entry,
                               entry + config_.sl_mult * atr,
                               entry - config_.target_mult * atr,
                               bar.time());
    }

    return TradeDecision::rejected(kind(), "No reversion signal conditions met");
}

TradeDecision MeanReversionStrategy::checkRiskReward(Direction signal, double entry, double stop,
                                                     double target, TimestampMs bar_time) const {
    const bool is_buy = signal == Direction::BUY;
    const double reward = is_buy ? target - entry : entry - target;
    const double required = config_.rr_threshold * (is_buy ? entry - stop : stop - entry);

    if (reward < required) {
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "Risk/reward too low %.2f < %.2f", reward, required);
        return TradeDecision::rejected(kind(), buffer);
    }
    return TradeDecision::valid(signal, entry, stop, target, kind(), bar_time);
}

} // namespace strategy
} // namespace daypilot
