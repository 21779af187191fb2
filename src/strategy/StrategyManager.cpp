#include "strategy/StrategyManager.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

namespace daypilot {
namespace strategy {

StrategyManager::StrategyManager(const StrategyConfig& config, MarketClock clock)
    : clock_(clock)
    , selector_(config.selector, config.breakout, clock)
    , filters_(config.filters)
    , breakout_(std::make_unique<BreakoutStrategy>(config.breakout, clock))
    , reversion_(std::make_unique<MeanReversionStrategy>(config.reversion))
{}

PreparedBars StrategyManager::prepare(const std::vector<Candle>& candles) const {
    const auto bars = analytics::TechnicalIndicators::addTechnicalIndicators(candles);
    PreparedBars prepared;
    prepared.plan = selector_.classifyDays(bars);
    prepared.bars = selector_.assignLevels(bars, prepared.plan);
    return prepared;
}

const IStrategy& StrategyManager::strategyFor(StrategyKind kind) const {
    return kind == StrategyKind::BREAKOUT ? *breakout_ : *reversion_;
}

TradeDecision StrategyManager::evaluate(const PreparedBars& prepared, size_t index) const {
    if (index >= prepared.bars.size()) {
        return TradeDecision::dataError(StrategyKind::REVERSION, "bar index out of range");
    }
    const int date = clock_.localDate(prepared.bars[index].time());
    return strategyFor(prepared.plan.strategyFor(date)).evaluate(prepared.bars, index);
}

TradeDecision StrategyManager::decide(const PreparedBars& prepared, size_t index,
                                      const ReentryContext& reentry) const {
    TradeDecision decision = evaluate(prepared, index);
    if (!decision.isValid()) {
        LOG_DEBUG("Decision rejected: {}", decision.reason);
        return decision;
    }
    return filters_.apply(decision, prepared.bars, index, reentry);
}

} // namespace strategy
} // namespace daypilot
