#pragma once

#include "common/MarketClock.h"
#include "common/Retry.h"
#include "common/Types.h"
#include "core/contracts/ITradeStore.h"
#include "data/IMarketDataSource.h"
#include "engine/EngineConfig.h"
#include "execution/IBrokerGateway.h"
#include "risk/PositionManager.h"
#include "risk/TradeState.h"
#include "risk/TrailingStopManager.h"
#include "strategy/StrategyManager.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace daypilot {
namespace engine {

enum class CycleOutcome {
    OUTSIDE_SESSION,
    DAILY_LOSS_HALT,        // terminal
    DATA_UNAVAILABLE,
    INSUFFICIENT_BARS,
    DATA_EXHAUSTED,         // terminal: too many consecutive short fetches
    MONITORED,
    MANUAL_EXIT,
    NO_SIGNAL,
    COOLDOWN,
    LATE_ENTRY_SKIPPED,
    ENTERED,
    CUTOFF,                 // terminal
    STOPPED                 // terminal
};

const char* toString(CycleOutcome outcome);
bool isTerminal(CycleOutcome outcome);

// Single-threaded polling loop: fetch, prepare, then either monitor the open
// trade or look for a new entry. One cycle runs to completion before the next.
class TradingEngine {
public:
    using NowFn = std::function<TimestampMs()>;

    TradingEngine(const EngineConfig& config,
                  const strategy::StrategyConfig& strategy_config,
                  const CalendarConfig& calendar_config,
                  data::IMarketDataSource& market_data,
                  execution::IBrokerGateway& broker,
                  core::ITradeStore& store,
                  NowFn now = &MarketClock::nowMs,
                  Sleeper sleeper = Sleeper());

    // ===== Engine control =====

    // Blocks until stop(), a daily loss halt, data exhaustion or the cutoff
    void run();
    void stop();
    bool isRunning() const { return running_; }

    CycleOutcome runCycle();

    // Closes the open trade at the latest close on the next cycle
    void requestManualExit(const std::string& reason);

    // ===== State =====

    const risk::TradeState& tradeState() const { return trade_state_; }
    const risk::PositionManager& positions() const { return positions_; }
    const strategy::StrategyManager& strategies() const { return strategies_; }
    int consecutiveShortFetches() const { return short_fetches_; }

private:
    std::optional<std::vector<Candle>> fetchWithBackoff();
    CycleOutcome tryEnter(const strategy::PreparedBars& prepared, TimestampMs now);
    bool lateEntryAllowed(const std::vector<IndicatorBar>& bars, TimestampMs bar_time) const;
    int computeLots();
    void closeDay(int today);
    void sleepFor(long long seconds);
    std::optional<std::string> takeManualExit();

    EngineConfig config_;
    MarketCalendar calendar_;
    data::IMarketDataSource& market_data_;
    execution::IBrokerGateway& broker_;
    core::ITradeStore& store_;
    NowFn now_;
    Sleeper sleeper_;

    strategy::StrategyManager strategies_;
    risk::TradeState trade_state_;
    risk::TrailingStopManager trailing_;
    risk::PositionManager positions_;

    std::atomic<bool> running_{false};
    int short_fetches_ = 0;

    std::mutex manual_exit_mutex_;
    std::optional<std::string> manual_exit_reason_;
};

} // namespace engine
} // namespace daypilot
