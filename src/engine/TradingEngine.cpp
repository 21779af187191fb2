#include "engine/TradingEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace daypilot {
namespace engine {

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::OUTSIDE_SESSION: return "OUTSIDE_SESSION";
        case CycleOutcome::DAILY_LOSS_HALT: return "DAILY_LOSS_HALT";
        case CycleOutcome::DATA_UNAVAILABLE: return "DATA_UNAVAILABLE";
        case CycleOutcome::INSUFFICIENT_BARS: return "INSUFFICIENT_BARS";
        case CycleOutcome::DATA_EXHAUSTED: return "DATA_EXHAUSTED";
        case CycleOutcome::MONITORED: return "MONITORED";
        case CycleOutcome::MANUAL_EXIT: return "MANUAL_EXIT";
        case CycleOutcome::NO_SIGNAL: return "NO_SIGNAL";
        case CycleOutcome::COOLDOWN: return "COOLDOWN";
        case CycleOutcome::LATE_ENTRY_SKIPPED: return "LATE_ENTRY_SKIPPED";
        case CycleOutcome::ENTERED: return "ENTERED";
        case CycleOutcome::CUTOFF: return "CUTOFF";
        case CycleOutcome::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

bool isTerminal(CycleOutcome outcome) {
    return outcome == CycleOutcome::DAILY_LOSS_HALT
        || outcome == CycleOutcome::DATA_EXHAUSTED
        || outcome == CycleOutcome::CUTOFF
        || outcome == CycleOutcome::STOPPED;
}

namespace {

risk::PositionConfig makePositionConfig(const EngineConfig& config) {
    risk::PositionConfig pc;
    pc.symbol = config.symbol;
    pc.trade_qty = config.trade_qty;
    pc.submit_orders = config.mode == TradingMode::LIVE;
    pc.order_retries = config.order_retries;
    pc.store_retries = config.store_retries;
    pc.retry_backoff_base = config.backoff_base_seconds;
    pc.cooldown_seconds = config.cooldown_seconds;
    pc.default_atr = config.default_atr;
    pc.target_mult_low_vol = config.target_mult_low_vol;
    pc.target_mult_high_vol = config.target_mult_high_vol;
    pc.health_lookahead = config.health.lookahead;
    pc.health_threshold_pct = config.health.threshold_pct;
    pc.health_grace_seconds = config.health.grace_seconds;
    return pc;
}

} // namespace

TradingEngine::TradingEngine(const EngineConfig& config,
                             const strategy::StrategyConfig& strategy_config,
                             const CalendarConfig& calendar_config,
                             data::IMarketDataSource& market_data,
                             execution::IBrokerGateway& broker,
                             core::ITradeStore& store,
                             NowFn now,
                             Sleeper sleeper)
    : config_(config)
    , calendar_(calendar_config)
    , market_data_(market_data)
    , broker_(broker)
    , store_(store)
    , now_(std::move(now))
    , sleeper_(std::move(sleeper))
    , strategies_(strategy_config, calendar_.clock())
    , trailing_()
    , positions_(trade_state_, broker_, store_, trailing_, makePositionConfig(config),
                 [this](std::chrono::milliseconds duration) { sleeper_(duration); })
{
    if (!now_) {
        now_ = &MarketClock::nowMs;
    }
    if (!sleeper_) {
        // Sleeps in short slices so stop() is honoured promptly
        sleeper_ = [this](std::chrono::milliseconds duration) {
            const auto deadline = std::chrono::steady_clock::now() + duration;
            while (running_) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    break;
                }
                std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(1000)));
            }
        };
    }
}

// ===== Engine control =====

void TradingEngine::run() {
    if (running_.exchange(true)) {
        LOG_WARN("Engine is already running");
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine started ({} {}, {} mode)", config_.symbol, config_.interval,
             config_.mode == TradingMode::LIVE ? "live" : "paper");
    LOG_INFO("========================================");

    while (running_) {
        CycleOutcome outcome = CycleOutcome::STOPPED;
        try {
            outcome = runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR("Trading cycle failed: {}", e.what());
            outcome = CycleOutcome::DATA_UNAVAILABLE;
        }

        if (isTerminal(outcome) || !running_) {
            LOG_INFO("Engine loop ending: {}", toString(outcome));
            break;
        }

        const long long pause = outcome == CycleOutcome::OUTSIDE_SESSION
            ? 5LL * config_.sleep_interval_seconds
            : config_.sleep_interval_seconds;
        sleepFor(pause);
    }
    running_ = false;

    const auto summary = store_.fetchSummary();
    LOG_INFO("Session summary: {} trades | P&L {:.2f} | win {:.1f}% | avg win {:.2f} | avg loss {:.2f}",
             summary.total_trades, summary.total_pnl, summary.win_pct, summary.avg_win, summary.avg_loss);
    Logger::getInstance().flush();
}

void TradingEngine::stop() {
    if (!running_) {
        return;
    }
    LOG_INFO("Stop requested");
    running_ = false;
}

void TradingEngine::requestManualExit(const std::string& reason) {
    std::lock_guard<std::mutex> lock(manual_exit_mutex_);
    manual_exit_reason_ = reason;
    LOG_INFO("Manual exit requested: {}", reason);
}

std::optional<std::string> TradingEngine::takeManualExit() {
    std::lock_guard<std::mutex> lock(manual_exit_mutex_);
    std::optional<std::string> reason;
    reason.swap(manual_exit_reason_);
    return reason;
}

void TradingEngine::sleepFor(long long seconds) {
    if (seconds > 0) {
        sleeper_(std::chrono::milliseconds(seconds * 1000));
    }
}

// ===== Cycle =====

CycleOutcome TradingEngine::runCycle() {
    const TimestampMs now = now_();

    if (!calendar_.isTradingSessionNow(now)) {
        LOG_INFO("Market closed. Sleeping...");
        return CycleOutcome::OUTSIDE_SESSION;
    }

    const int today = calendar_.clock().localDate(now);
    const double pnl_today = store_.fetchPnlToday(today);
    if (pnl_today <= -config_.max_daily_loss) {
        LOG_WARN("Daily loss threshold breached: {:.2f} <= {:.2f}. Trading disabled for today",
                 pnl_today, -config_.max_daily_loss);
        closeDay(today);
        return CycleOutcome::DAILY_LOSS_HALT;
    }

    const auto candles = fetchWithBackoff();
    if (!candles) {
        return CycleOutcome::DATA_UNAVAILABLE;
    }

    strategy::PreparedBars prepared;
    try {
        prepared = strategies_.prepare(*candles);
    } catch (const DataError& e) {
        LOG_WARN("Bars could not be prepared: {}", e.what());
        return CycleOutcome::DATA_UNAVAILABLE;
    }

    if (prepared.bars.size() < static_cast<size_t>(config_.min_bars)) {
        ++short_fetches_;
        LOG_INFO("Waiting for sufficient data... {} of {} bars", prepared.bars.size(), config_.min_bars);
        if (short_fetches_ >= config_.max_data_retries) {
            LOG_WARN("Max retries reached while waiting for sufficient data");
            return CycleOutcome::DATA_EXHAUSTED;
        }
        return CycleOutcome::INSUFFICIENT_BARS;
    }
    short_fetches_ = 0;

    const auto manual_exit = takeManualExit();
    if (positions_.hasOpenPosition()) {
        CycleOutcome outcome = CycleOutcome::MONITORED;
        if (manual_exit) {
            positions_.exitPosition(prepared.bars.back().candle.close, "Manual exit: " + *manual_exit, now);
            outcome = CycleOutcome::MANUAL_EXIT;
        } else {
            const auto tick = positions_.monitorTick(prepared.bars, now);
            LOG_DEBUG("Monitoring tick: {}", risk::toString(tick));
        }

        if (!config_.weekend_testing && calendar_.clock().minuteOfDay(now) >= config_.cutoff_minute) {
            if (positions_.hasOpenPosition()) {
                LOG_INFO("Cutoff reached with trade {} open, squaring off", trade_state_.trade_id);
                positions_.exitPosition(prepared.bars.back().candle.close, "Cutoff square-off", now);
            }
            closeDay(today);
            return CycleOutcome::CUTOFF;
        }
        return outcome;
    }

    if (manual_exit) {
        LOG_WARN("Manual exit ({}) ignored: no open trade", *manual_exit);
    }

    if (!config_.weekend_testing && calendar_.clock().minuteOfDay(now) >= config_.cutoff_minute) {
        closeDay(today);
        return CycleOutcome::CUTOFF;
    }

    return tryEnter(prepared, now);
}

std::optional<std::vector<Candle>> TradingEngine::fetchWithBackoff() {
    try {
        return retryWithBackoff(
            [this]() {
                return market_data_.fetchBars(config_.symbol, config_.interval, config_.lookback_days);
            },
            config_.fetch_retries, config_.backoff_base_seconds, sleeper_, "Market data fetch");
    } catch (const std::exception& e) {
        LOG_ERROR("Market data unavailable, pausing: {}", e.what());
        return std::nullopt;
    }
}

// ===== Entry =====

CycleOutcome TradingEngine::tryEnter(const strategy::PreparedBars& prepared, TimestampMs now) {
    if (positions_.inCooldown(now)) {
        LOG_INFO("In cooldown, waiting");
        return CycleOutcome::COOLDOWN;
    }

    const size_t last = prepared.bars.size() - 1;
    const auto decision = strategies_.decide(prepared, last, positions_.reentryContext());
    if (decision.isDataError()) {
        LOG_WARN("Evaluation failed: {}", decision.reason);
        return CycleOutcome::NO_SIGNAL;
    }
    if (!decision.isValid()) {
        LOG_INFO("No signal: {}", decision.reason);
        return CycleOutcome::NO_SIGNAL;
    }

    if (!lateEntryAllowed(prepared.bars, decision.bar_time)) {
        return CycleOutcome::LATE_ENTRY_SKIPPED;
    }

    const int lots = computeLots();
    if (!positions_.openPosition(decision, lots, prepared.bars.back().atr, now)) {
        return CycleOutcome::NO_SIGNAL;
    }
    return CycleOutcome::ENTERED;
}

bool TradingEngine::lateEntryAllowed(const std::vector<IndicatorBar>& bars, TimestampMs bar_time) const {
    if (calendar_.clock().minuteOfDay(bar_time) < config_.late_entry_minute) {
        return true;
    }

    double sum = 0.0;
    int count = 0;
    for (const auto& bar : bars) {
        if (bar.atr) {
            sum += *bar.atr;
            ++count;
        }
    }
    const auto& current = bars.back().atr;
    if (count == 0 || !current) {
        LOG_INFO("Skipping late entry: ATR unavailable");
        return false;
    }

    const double threshold = config_.late_entry_atr_ratio * (sum / count);
    if (*current < threshold) {
        LOG_INFO("Skipping late entry: ATR {:.2f} below threshold {:.2f}", *current, threshold);
        return false;
    }
    LOG_INFO("Late entry allowed: ATR {:.2f} above threshold {:.2f}", *current, threshold);
    return true;
}

int TradingEngine::computeLots() {
    double margin = config_.fallback_margin;
    try {
        margin = broker_.getAvailableMargin();
    } catch (const std::exception& e) {
        LOG_WARN("Margin lookup failed ({}), assuming {:.2f}", e.what(), config_.fallback_margin);
    }
    const int lots = static_cast<int>(std::floor(margin / config_.margin_per_lot));
    return std::max(1, lots);
}

void TradingEngine::closeDay(int today) {
    LOG_INFO("Closing the trading day, populating daily trade log");
    if (positions_.hasOpenPosition()) {
        LOG_WARN("Trade {} is still open at end of day", trade_state_.trade_id);
    }
    if (!store_.populateDailyLog(today)) {
        LOG_ERROR("Daily trade log could not be populated for {}", today);
    }
}

} // namespace engine
} // namespace daypilot
