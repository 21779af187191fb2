#include "strategy/SignalFilterChain.h"
#include "common/Logger.h"
#include <cmath>
#include <cstdio>

namespace daypilot {
namespace strategy {

SignalFilterChain::SignalFilterChain(FilterConfig config)
    : config_(config)
{}

TradeDecision SignalFilterChain::apply(TradeDecision decision,
                                       const std::vector<IndicatorBar>& bars,
                                       size_t index,
                                       const ReentryContext& reentry) const {
    if (!decision.isValid()) {
        return decision;
    }
    if (index >= bars.size()) {
        decision.reject("Signal bar not found");
        return decision;
    }

    const IndicatorBar& bar = bars[index];

    std::optional<std::string> failure = checkVolume(bars, index);
    if (!failure) failure = checkMomentum(bars, index, decision.signal);
    if (!failure) failure = checkPostCooldownCandle(bar, reentry);
    if (!failure && (reentry.last_exit_price || reentry.last_exit_time)) {
        if (!bar.atr) {
            failure = std::string("Missing ATR for re-entry checks");
        } else {
            failure = checkSameZone(decision.entry_price, *bar.atr, bar.time(), reentry);
            if (!failure) failure = checkPullback(decision.entry_price, *bar.atr, decision.signal, reentry);
        }
    }

    if (failure) {
        LOG_DEBUG("Filter rejected {} {}: {}", toString(decision.strategy), toString(decision.signal), *failure);
        decision.reject(*failure);
    }
    return decision;
}

// ===== Volume =====

std::optional<std::string> SignalFilterChain::checkVolume(const std::vector<IndicatorBar>& bars,
                                                          size_t index) const {
    const double volume = bars[index].candle.volume;
    const size_t window = static_cast<size_t>(config_.volume_window);
    if (index < window) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "Volume too low: %.0f, fewer than %zu prior bars", volume, window);
        return std::string(buffer);
    }

    double sum = 0.0;
    for (size_t i = index - window; i < index; ++i) {
        sum += bars[i].candle.volume;
    }
    const double average = sum / static_cast<double>(window);

    if (!(volume > config_.volume_multiplier * average)) {
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "Volume too low: %.0f <= %.1fx avg (%.0f)",
                      volume, config_.volume_multiplier, average);
        return std::string(buffer);
    }
    return std::nullopt;
}

// ===== Momentum =====

std::optional<std::string> SignalFilterChain::checkMomentum(const std::vector<IndicatorBar>& bars,
                                                            size_t index, Direction signal) const {
    const size_t count = static_cast<size_t>(config_.momentum_bars);
    const std::string reason = "Weak momentum across last " + std::to_string(count) + " candles";
    if (index < count) {
        return reason;
    }

    for (size_t i = index - count; i < index; ++i) {
        const Candle& c = bars[i].candle;
        const bool aligned = signal == Direction::SELL ? c.isBearish() : c.isBullish();
        if (!aligned) {
            return reason;
        }
    }
    return std::nullopt;
}

// ===== Re-entry guards =====

bool SignalFilterChain::withinCooldown(TimestampMs bar_time, const ReentryContext& reentry) const {
    if (!reentry.last_exit_time) return false;
    const long long elapsed_ms = bar_time - *reentry.last_exit_time;
    return elapsed_ms < config_.cooldown_seconds * 1000;
}

std::optional<std::string> SignalFilterChain::checkPostCooldownCandle(const IndicatorBar& bar,
                                                                      const ReentryContext& reentry) const {
    if (withinCooldown(bar.time(), reentry) && config_.candle.isWeak(bar.candle)) {
        return std::string("Weak post-cooldown candle");
    }
    return std::nullopt;
}

std::optional<std::string> SignalFilterChain::checkSameZone(double entry, double atr, TimestampMs bar_time,
                                                            const ReentryContext& reentry) const {
    if (!reentry.last_exit_price || !reentry.last_exit_time) {
        return std::nullopt;
    }
    const double distance = std::fabs(entry - *reentry.last_exit_price);
    if (distance < config_.reentry_atr_fraction * atr && withinCooldown(bar_time, reentry)) {
        return std::string("Same-zone reentry");
    }
    return std::nullopt;
}

std::optional<std::string> SignalFilterChain::checkPullback(double entry, double atr, Direction signal,
                                                            const ReentryContext& reentry) const {
    if (!reentry.last_exit_price) {
        return std::nullopt;
    }
    const double last = *reentry.last_exit_price;
    const double move = config_.reentry_atr_fraction * atr;
    const bool moved = signal == Direction::SELL ? entry < last - move : entry > last + move;
    if (!moved) {
        return std::string("No pullback for re-entry");
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace daypilot
