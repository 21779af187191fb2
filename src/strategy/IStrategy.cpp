#include "strategy/IStrategy.h"
#include "common/Logger.h"

namespace daypilot {
namespace strategy {

const char* toString(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::VALID: return "VALID";
        case DecisionStatus::REJECTED: return "REJECTED";
        case DecisionStatus::DATA_ERROR: return "DATA_ERROR";
    }
    return "UNKNOWN";
}

TradeDecision TradeDecision::valid(Direction signal, double entry, double stop, double target,
                                   StrategyKind strategy, TimestampMs bar_time) {
    TradeDecision d;
    d.status = DecisionStatus::VALID;
    d.signal = signal;
    d.entry_price = entry;
    d.stop_loss = stop;
    d.target = target;
    d.strategy = strategy;
    d.bar_time = bar_time;
    return d;
}

TradeDecision TradeDecision::rejected(StrategyKind strategy, const std::string& why) {
    TradeDecision d;
    d.strategy = strategy;
    d.reason = why;
    return d;
}

TradeDecision TradeDecision::dataError(StrategyKind strategy, const std::string& detail) {
    TradeDecision d;
    d.status = DecisionStatus::DATA_ERROR;
    d.strategy = strategy;
    d.reason = detail;
    return d;
}

TradeDecision IStrategy::evaluate(const std::vector<IndicatorBar>& bars, size_t index) const {
    if (index >= bars.size()) {
        return TradeDecision::dataError(kind(), "bar index out of range");
    }
    try {
        return evaluateBar(bars, index);
    } catch (const std::exception& e) {
        LOG_ERROR("{} evaluation error: {}", getInfo().name, e.what());
        return TradeDecision::dataError(kind(), std::string("Exception: ") + e.what());
    }
}

} // namespace strategy
} // namespace daypilot
