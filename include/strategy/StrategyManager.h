#pragma once

#include "strategy/IStrategy.h"
#include "strategy/BreakoutStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/SignalFilterChain.h"
#include "strategy/StrategySelector.h"
#include <memory>
#include <vector>

namespace daypilot {
namespace strategy {

// Bars with indicators and levels, plus the plan they were levelled with
struct PreparedBars {
    std::vector<IndicatorBar> bars;
    DailyPlan plan;
};

// Runs one decision cycle: indicators -> daily plan -> levels -> evaluator
// of the day's strategy -> filter chain.
class StrategyManager {
public:
    StrategyManager(const StrategyConfig& config, MarketClock clock);

    // Throws DataError when no usable bar remains
    PreparedBars prepare(const std::vector<Candle>& candles) const;

    TradeDecision decide(const PreparedBars& prepared, size_t index, const ReentryContext& reentry) const;

    // Evaluator output before filtering
    TradeDecision evaluate(const PreparedBars& prepared, size_t index) const;

    const IStrategy& strategyFor(StrategyKind kind) const;
    const StrategySelector& selector() const { return selector_; }
    const SignalFilterChain& filters() const { return filters_; }

private:
    MarketClock clock_;
    StrategySelector selector_;
    SignalFilterChain filters_;
    std::unique_ptr<IStrategy> breakout_;
    std::unique_ptr<IStrategy> reversion_;
};

} // namespace strategy
} // namespace daypilot
