#pragma once

#include "common/Retry.h"
#include "core/contracts/ITradeStore.h"
#include "execution/IBrokerGateway.h"
#include "risk/TradeState.h"
#include "risk/TrailingStopManager.h"
#include "strategy/IStrategy.h"
#include "strategy/SignalFilterChain.h"
#include <optional>
#include <string>
#include <vector>

namespace daypilot {
namespace risk {

struct PositionConfig {
    std::string symbol = "BANKNIFTY";
    int trade_qty = 15;
    bool submit_orders = false;             // live mode only
    int order_retries = 3;
    int store_retries = 3;
    double retry_backoff_base = 2.0;        // seconds, raised to the attempt number
    long long cooldown_seconds = 15 * 60;
    double default_atr = 20.0;
    double target_mult_low_vol = 1.8;       // ATR below the running median
    double target_mult_high_vol = 2.5;

    // post-entry health check
    int health_lookahead = 3;
    double health_threshold_pct = 0.15;
    long long health_grace_seconds = 900;
};

enum class HealthVerdict {
    INVALID,    // not enough bars after entry, or entry bar not found
    PASSED,
    FAILED
};

struct HealthCheckResult {
    HealthVerdict verdict = HealthVerdict::INVALID;
    double move_pct = 0.0;
};

enum class TickOutcome {
    NO_POSITION,
    HOLDING,
    STOP_HIT,
    WEAK_FOLLOW_THROUGH
};

const char* toString(TickOutcome outcome);

// Owns the Flat -> Open -> Flat lifecycle of the single TradeState.
// In live mode every entry is a market order followed by an exit-side SL-M
// stop; the stop follows the trailing stop and is cancelled before any other
// exit. Broker and store calls are retried with backoff. Only a failed entry
// order refuses the open; later failures are logged and never roll back a
// state change.
class PositionManager {
public:
    PositionManager(TradeState& state,
                    execution::IBrokerGateway& broker,
                    core::ITradeStore& store,
                    const TrailingStopManager& trailing,
                    PositionConfig config,
                    Sleeper sleeper = Sleeper());

    // Refuses (false) when a trade is already open, the decision is not valid
    // or the entry order could not be placed
    bool openPosition(const strategy::TradeDecision& decision, int lots,
                      std::optional<double> current_atr, TimestampMs now);

    // One monitoring step on freshly prepared bars: ATR update, trailing stop,
    // stop check, then the one-time health check once the grace period passed.
    TickOutcome monitorTick(const std::vector<IndicatorBar>& bars, TimestampMs now);

    // Returns net P&L, or nothing when no trade was open
    std::optional<double> exitPosition(double price, const std::string& reason, TimestampMs now);

    bool inCooldown(TimestampMs now) const;
    bool hasOpenPosition() const { return state_.open; }

    strategy::ReentryContext reentryContext() const;

    static HealthCheckResult postEntryHealthCheck(const std::vector<IndicatorBar>& bars,
                                                  TimestampMs entry_bar_time,
                                                  int lookahead, double threshold_pct);

    static std::string generateTradeId();

    double currentAtr() const { return atr_; }
    const std::vector<double>& atrHistory() const { return atr_history_; }
    double realizedPnl() const { return realized_pnl_; }
    const TradeState& state() const { return state_; }

private:
    double adjustTargetPrice(Direction direction, double entry);
    core::TradeRecord makeRecord(const std::string& notes, bool exited, double exit_price,
                                 double pnl, TimestampMs now) const;
    std::optional<double> closePosition(double price, const std::string& reason, TimestampMs now,
                                        bool stop_filled);
    void persist(const core::TradeRecord& record);
    bool placeEntryOrder(Direction direction, int quantity);
    void submitProtectiveStop();
    void moveProtectiveStop();
    void flattenAtBroker(bool stop_filled);

    TradeState& state_;
    execution::IBrokerGateway& broker_;
    core::ITradeStore& store_;
    const TrailingStopManager& trailing_;
    PositionConfig config_;
    Sleeper sleeper_;

    double atr_ = 0.0;
    std::vector<double> atr_history_;
    double realized_pnl_ = 0.0;
};

} // namespace risk
} // namespace daypilot
