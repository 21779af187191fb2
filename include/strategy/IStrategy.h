#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace daypilot {
namespace strategy {

enum class DecisionStatus {
    VALID,          // a directional proposal
    REJECTED,       // ordinary negative outcome, reason says why
    DATA_ERROR      // the bar could not be evaluated; caller may retry
};

const char* toString(DecisionStatus status);

// Outcome of evaluating one bar. Only reject() mutates it, and only towards
// REJECTED.
struct TradeDecision {
    DecisionStatus status;
    Direction signal;
    double entry_price;
    double stop_loss;
    double target;
    StrategyKind strategy;
    TimestampMs bar_time;
    std::string reason;

    TradeDecision()
        : status(DecisionStatus::REJECTED)
        , signal(Direction::NONE)
        , entry_price(0.0)
        , stop_loss(0.0)
        , target(0.0)
        , strategy(StrategyKind::REVERSION)
        , bar_time(0)
    {}

    bool isValid() const { return status == DecisionStatus::VALID; }
    bool isDataError() const { return status == DecisionStatus::DATA_ERROR; }

    void reject(const std::string& why) {
        status = DecisionStatus::REJECTED;
        reason = why;
    }

    static TradeDecision valid(Direction signal, double entry, double stop, double target,
                               StrategyKind strategy, TimestampMs bar_time);
    static TradeDecision rejected(StrategyKind strategy, const std::string& why);
    static TradeDecision dataError(StrategyKind strategy, const std::string& detail);
};

struct StrategyInfo {
    std::string name;
    std::string description;
};

// Stateless per-bar evaluator. evaluate() never throws: a failure inside
// evaluateBar() comes back as a DATA_ERROR decision.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;
    virtual StrategyKind kind() const = 0;

    TradeDecision evaluate(const std::vector<IndicatorBar>& bars, size_t index) const;

protected:
    virtual TradeDecision evaluateBar(const std::vector<IndicatorBar>& bars, size_t index) const = 0;
};

} // namespace strategy
} // namespace daypilot
