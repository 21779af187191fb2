#include "strategy/StrategySelector.h"
#include "common/Logger.h"
#include <algorithm>

namespace daypilot {
namespace strategy {

// ===== DailyPlan =====

DailyPlan::DailyPlan(StrategyMode mode, StrategyKind fixed_strategy, std::map<int, DayAssignment> days)
    : mode_(mode)
    , fixed_strategy_(fixed_strategy)
    , days_(std::move(days))
{}

StrategyKind DailyPlan::strategyFor(int date) const {
    if (mode_ == StrategyMode::FIXED) {
        return fixed_strategy_;
    }
    return assignedStrategy(date).value_or(StrategyKind::REVERSION);
}

std::optional<StrategyKind> DailyPlan::assignedStrategy(int date) const {
    const DayAssignment* d = day(date);
    return d ? d->strategy : std::nullopt;
}

const DayAssignment* DailyPlan::day(int date) const {
    auto it = days_.find(date);
    return it == days_.end() ? nullptr : &it->second;
}

// ===== StrategySelector =====

StrategySelector::StrategySelector(SelectorConfig selector, BreakoutStrategyConfig breakout, MarketClock clock)
    : selector_(selector)
    , breakout_(breakout)
    , clock_(clock)
{}

bool StrategySelector::inOpeningRange(TimestampMs ts) const {
    const int second = clock_.toLocal(ts).second_of_day;
    return second >= selector_.opening_range_start * 60 && second <= selector_.opening_range_end * 60;
}

std::optional<OpeningRange> StrategySelector::openingRange(const std::vector<IndicatorBar>& day_bars) const {
    OpeningRange range;
    double range_sum = 0.0;
    for (const auto& bar : day_bars) {
        if (!inOpeningRange(bar.time())) continue;

        const Candle& c = bar.candle;
        if (range.bars == 0) {
            range.high = c.high;
            range.low = c.low;
        } else {
            range.high = std::max(range.high, c.high);
            range.low = std::min(range.low, c.low);
        }
        range_sum += c.range();
        ++range.bars;
    }
    if (range.bars == 0) {
        return std::nullopt;
    }
    range.mean_bar_range = range_sum / range.bars;
    return range;
}

StrategyKind StrategySelector::classifyDay(const std::vector<IndicatorBar>& day_bars) const {
    if (selector_.mode == StrategyMode::FIXED) {
        return selector_.fixed_strategy;
    }
    const auto range = openingRange(day_bars);
    if (range && range->mean_bar_range > selector_.breakout_volatility_threshold) {
        return StrategyKind::BREAKOUT;
    }
    return StrategyKind::REVERSION;
}

std::map<int, std::vector<IndicatorBar>> StrategySelector::groupByDate(const std::vector<IndicatorBar>& bars) const {
    std::map<int, std::vector<IndicatorBar>> grouped;
    for (const auto& bar : bars) {
        grouped[clock_.localDate(bar.time())].push_back(bar);
    }
    return grouped;
}

DailyPlan StrategySelector::classifyDays(const std::vector<IndicatorBar>& bars) const {
    std::map<int, DayAssignment> days;

    for (const auto& entry : groupByDate(bars)) {
        DayAssignment assignment;
        assignment.date = entry.first;
        assignment.opening_range = openingRange(entry.second);

        if (!assignment.opening_range) {
            LOG_WARN("Skipping strategy assignment on {}: no opening range bars", entry.first);
        } else if (assignment.opening_range->span() < selector_.min_opening_range) {
            LOG_WARN("Skipping strategy assignment on {} due to narrow opening range ({:.2f})",
                     entry.first, assignment.opening_range->span());
        } else {
            assignment.strategy = classifyDay(entry.second);
            LOG_DEBUG("Strategy for {}: {}", entry.first, toString(*assignment.strategy));
        }
        days.emplace(entry.first, assignment);
    }

    return DailyPlan(selector_.mode, selector_.fixed_strategy, std::move(days));
}

std::vector<IndicatorBar> StrategySelector::assignLevels(const std::vector<IndicatorBar>& bars,
                                                         const DailyPlan& plan) const {
    std::vector<IndicatorBar> out = bars;

    const bool fixed_reversion = selector_.mode == StrategyMode::FIXED &&
                                 selector_.fixed_strategy == StrategyKind::REVERSION;

    for (auto& bar : out) {
        bar.breakout_long_entry.reset();
        bar.breakout_short_entry.reset();
        bar.breakout_stop_distance.reset();
        bar.breakout_target_distance.reset();

        if (fixed_reversion) {
            bar.breakout_long_entry = 0.0;
            bar.breakout_short_entry = 0.0;
            bar.breakout_stop_distance = 0.0;
            bar.breakout_target_distance = 0.0;
            continue;
        }

        const DayAssignment* day = plan.day(clock_.localDate(bar.time()));
        if (!day || !day->strategy) {
            continue;
        }

        if (*day->strategy == StrategyKind::BREAKOUT) {
            const double atr = bar.atr.value_or(breakout_.default_atr);
            const double stop_distance = std::max(breakout_.min_stop_distance, atr * breakout_.sl_factor);
            bar.breakout_long_entry = day->opening_range->high + breakout_.entry_buffer;
            bar.breakout_short_entry = day->opening_range->low - breakout_.entry_buffer;
            bar.breakout_stop_distance = stop_distance;
            bar.breakout_target_distance = stop_distance * breakout_.target_factor;
        } else {
            bar.breakout_long_entry = 0.0;
            bar.breakout_short_entry = 0.0;
            bar.breakout_stop_distance = 0.0;
            bar.breakout_target_distance = 0.0;
        }
    }
    return out;
}

} // namespace strategy
} // namespace daypilot
