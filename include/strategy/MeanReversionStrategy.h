#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace daypilot {
namespace strategy {

// Typical-price band reversion. A long needs the close to cross above the
// upper band this bar while staying above the long EMA; shorts mirror it.
// Stop and target are ATR multiples around the close.
class MeanReversionStrategy : public IStrategy {
public:
    explicit MeanReversionStrategy(ReversionStrategyConfig config);

    StrategyInfo getInfo() const override;
    StrategyKind kind() const override { return StrategyKind::REVERSION; }

    const ReversionStrategyConfig& config() const { return config_; }

protected:
    TradeDecision evaluateBar(const std::vector<IndicatorBar>& bars, size_t index) const override;

private:
    TradeDecision checkRiskReward(Direction signal, double entry, double stop, double target,
                                  TimestampMs bar_time) const;

    ReversionStrategyConfig config_;
};

} // namespace strategy
} // namespace daypilot
