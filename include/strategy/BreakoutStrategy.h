#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "common/MarketClock.h"

namespace daypilot {
namespace strategy {

// Opening-range breakout. Enters when the bar reaches the day's long/short
// entry level and the previous bar closed in the same direction. Levels come
// from StrategySelector::assignLevels.
class BreakoutStrategy : public IStrategy {
public:
    BreakoutStrategy(BreakoutStrategyConfig config, MarketClock clock);

    StrategyInfo getInfo() const override;
    StrategyKind kind() const override { return StrategyKind::BREAKOUT; }

    const BreakoutStrategyConfig& config() const { return config_; }

protected:
    TradeDecision evaluateBar(const std::vector<IndicatorBar>& bars, size_t index) const override;

private:
    bool insideTradingWindow(TimestampMs ts) const;

    BreakoutStrategyConfig config_;
    MarketClock clock_;
};

} // namespace strategy
} // namespace daypilot
