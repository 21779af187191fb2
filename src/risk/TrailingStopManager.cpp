#include "risk/TrailingStopManager.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace daypilot {
namespace risk {

TrailingStopManager::TrailingStopManager(TrailingStopConfig config)
    : config_(config)
{}

bool TrailingStopManager::isImprovement(const TradeState& state, double candidate) const {
    return state.direction == Direction::BUY ? candidate > state.stop_loss : candidate < state.stop_loss;
}

std::optional<double> TrailingStopManager::candidateStop(const TradeState& state, double price, double atr,
                                                         long long age_seconds) const {
    const bool is_buy = state.direction == Direction::BUY;
    const double sign = is_buy ? 1.0 : -1.0;

    if (std::fabs(price - state.target_price) <= config_.near_target_atr * atr) {
        LOG_INFO("Near target, tightening stop aggressively");
        return price - sign * config_.near_target_offset;
    }

    const double move = is_buy ? price - state.entry_price : state.entry_price - price;
    if (move < config_.trigger_move_atr * atr) {
        return std::nullopt;
    }

    const double fallback_distance = age_seconds > config_.aged_seconds
        ? std::min(config_.aged_fallback_cap, atr)
        : atr;
    const double natural = price - sign * config_.natural_atr_mult * atr;
    const double fallback = price - sign * fallback_distance;

    if (isImprovement(state, natural)) return natural;
    if (isImprovement(state, fallback)) return fallback;
    return std::nullopt;
}

std::optional<double> TrailingStopManager::update(TradeState& state, double price, double atr,
                                                  TimestampMs now) const {
    if (!state.open || state.direction == Direction::NONE || !(atr > 0.0)) {
        return std::nullopt;
    }

    const long long age_seconds = (now - state.entry_time) / 1000;
    if (age_seconds < config_.min_age_seconds) {
        LOG_DEBUG("Skipping stop trail, trade age {}s", age_seconds);
        return std::nullopt;
    }

    const auto candidate = candidateStop(state, price, atr, age_seconds);
    if (!candidate) {
        return std::nullopt;
    }

    const double new_stop = roundTo2(*candidate);
    if (std::fabs(new_stop - state.stop_loss) < config_.min_change) {
        LOG_DEBUG("Stop unchanged at {:.2f}", state.stop_loss);
        return std::nullopt;
    }
    if (!isImprovement(state, new_stop)) {
        return std::nullopt;
    }

    state.stop_loss = new_stop;
    state.last_sl_update_time = now;
    LOG_INFO("Price: {:.2f} | SL: {:.2f}", price, new_stop);
    return new_stop;
}

} // namespace risk
} // namespace daypilot
