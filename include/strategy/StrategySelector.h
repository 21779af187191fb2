#pragma once

#include "strategy/StrategyConfig.h"
#include "common/MarketClock.h"
#include <map>
#include <optional>
#include <vector>

namespace daypilot {
namespace strategy {

struct OpeningRange {
    double high = 0.0;
    double low = 0.0;
    double mean_bar_range = 0.0;
    int bars = 0;

    double span() const { return high - low; }
};

struct DayAssignment {
    int date = 0;                               // YYYYMMDD, exchange local
    std::optional<OpeningRange> opening_range;
    std::optional<StrategyKind> strategy;       // empty when the day was skipped
};

// Per-day strategy choice, built once by StrategySelector::classifyDays and
// read-only afterwards.
class DailyPlan {
public:
    DailyPlan() = default;
    DailyPlan(StrategyMode mode, StrategyKind fixed_strategy, std::map<int, DayAssignment> days);

    // Strategy to evaluate bars of `date` with. Adaptive days without an
    // assignment fall back to REVERSION.
    StrategyKind strategyFor(int date) const;

    std::optional<StrategyKind> assignedStrategy(int date) const;
    const DayAssignment* day(int date) const;
    const std::map<int, DayAssignment>& days() const { return days_; }
    StrategyMode mode() const { return mode_; }

private:
    StrategyMode mode_ = StrategyMode::ADAPTIVE;
    StrategyKind fixed_strategy_ = StrategyKind::BREAKOUT;
    std::map<int, DayAssignment> days_;
};

class StrategySelector {
public:
    StrategySelector(SelectorConfig selector, BreakoutStrategyConfig breakout, MarketClock clock);

    // Empty when no bar of the day falls inside the opening-range window
    std::optional<OpeningRange> openingRange(const std::vector<IndicatorBar>& day_bars) const;

    // BREAKOUT when the mean opening-range bar range exceeds the threshold
    StrategyKind classifyDay(const std::vector<IndicatorBar>& day_bars) const;

    DailyPlan classifyDays(const std::vector<IndicatorBar>& bars) const;

    // Returns a copy of `bars` with breakout level fields set per the plan:
    // BREAKOUT days get levels, REVERSION days get zeros, skipped days stay empty.
    std::vector<IndicatorBar> assignLevels(const std::vector<IndicatorBar>& bars, const DailyPlan& plan) const;

    // Groups bars by exchange-local date, preserving order inside each day
    std::map<int, std::vector<IndicatorBar>> groupByDate(const std::vector<IndicatorBar>& bars) const;

private:
    bool inOpeningRange(TimestampMs ts) const;

    SelectorConfig selector_;
    BreakoutStrategyConfig breakout_;
    MarketClock clock_;
};

} // namespace strategy
} // namespace daypilot
