#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace daypilot {
namespace strategy {

// What the previous trade left behind for re-entry checks
struct ReentryContext {
    std::optional<TimestampMs> last_exit_time;
    std::optional<double> last_exit_price;
};

// Guards run in order on a valid decision; the first failing guard rejects it
// and the rest are skipped. Each check returns a rejection reason or nothing.
class SignalFilterChain {
public:
    explicit SignalFilterChain(FilterConfig config);

    TradeDecision apply(TradeDecision decision,
                        const std::vector<IndicatorBar>& bars,
                        size_t index,
                        const ReentryContext& reentry) const;

    std::optional<std::string> checkVolume(const std::vector<IndicatorBar>& bars, size_t index) const;
    std::optional<std::string> checkMomentum(const std::vector<IndicatorBar>& bars, size_t index,
                                             Direction signal) const;
    std::optional<std::string> checkPostCooldownCandle(const IndicatorBar& bar,
                                                       const ReentryContext& reentry) const;
    std::optional<std::string> checkSameZone(double entry, double atr, TimestampMs bar_time,
                                             const ReentryContext& reentry) const;
    std::optional<std::string> checkPullback(double entry, double atr, Direction signal,
                                             const ReentryContext& reentry) const;

    const FilterConfig& config() const { return config_; }

private:
    bool withinCooldown(TimestampMs bar_time, const ReentryContext& reentry) const;

    FilterConfig config_;
};

} // namespace strategy
} // namespace daypilot
