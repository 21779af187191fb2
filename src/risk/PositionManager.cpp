#include "risk/PositionManager.h"
#include "risk/TransactionCosts.h"
#include "common/Logger.h"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace daypilot {
namespace risk {

const char* toString(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::NO_POSITION: return "NO_POSITION";
        case TickOutcome::HOLDING: return "HOLDING";
        case TickOutcome::STOP_HIT: return "STOP_HIT";
        case TickOutcome::WEAK_FOLLOW_THROUGH: return "WEAK_FOLLOW_THROUGH";
    }
    return "UNKNOWN";
}

PositionManager::PositionManager(TradeState& state,
                                 execution::IBrokerGateway& broker,
                                 core::ITradeStore& store,
                                 const TrailingStopManager& trailing,
                                 PositionConfig config,
                                 Sleeper sleeper)
    : state_(state)
    , broker_(broker)
    , store_(store)
    , trailing_(trailing)
    , config_(std::move(config))
    , sleeper_(std::move(sleeper))
{
    config_.order_retries = std::max(1, config_.order_retries);
    config_.store_retries = std::max(1, config_.store_retries);
}

std::string PositionManager::generateTradeId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    oss << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-4" << std::setw(3) << (part1 & 0xFFF)
        << "-" << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFF);

    return oss.str();
}

// ===== Entry =====

bool PositionManager::openPosition(const strategy::TradeDecision& decision, int lots,
                                   std::optional<double> current_atr, TimestampMs now) {
    if (state_.open) {
        LOG_ERROR("Trade {} already open, refusing new {} entry", state_.trade_id, toString(decision.signal));
        return false;
    }
    if (!decision.isValid() || decision.signal == Direction::NONE) {
        LOG_ERROR("Refusing to open a position from a non-valid decision ({})", decision.reason);
        return false;
    }
    if (lots < 1) {
        LOG_ERROR("Refusing to open a position with {} lots", lots);
        return false;
    }

    const int quantity = config_.trade_qty * lots;
    if (config_.submit_orders && !placeEntryOrder(decision.signal, quantity)) {
        return false;
    }

    if (current_atr && *current_atr > 0.0) {
        atr_ = *current_atr;
    }

    state_.trade_id = generateTradeId();
    state_.entry_time = now;
    state_.entry_bar_time = decision.bar_time;
    state_.direction = decision.signal;
    state_.entry_price = roundTo2(decision.entry_price);
    state_.stop_loss = roundTo2(decision.stop_loss);
    state_.strategy = decision.strategy;
    state_.last_sl_update_time.reset();
    state_.checked_post_entry = false;
    state_.lots = lots;
    state_.quantity = quantity;
    state_.stop_order_id.clear();
    state_.target_price = adjustTargetPrice(decision.signal, state_.entry_price);
    state_.open = true;

    persist(makeRecord("Order placed", false, 0.0, 0.0, now));

    if (config_.submit_orders) {
        submitProtectiveStop();
    }

    Logger::getInstance().logTrade(config_.symbol, std::string("ENTER ") + toString(state_.direction),
                                   state_.entry_price, state_.quantity, 0.0);
    LOG_INFO("New {} ({}): {:.2f} | SL: {:.2f} | target: {:.2f} | qty: {}",
             toString(state_.direction), toString(state_.strategy), state_.entry_price,
             state_.stop_loss, state_.target_price, state_.quantity);
    return true;
}

double PositionManager::adjustTargetPrice(Direction direction, double entry) {
    const double atr = atr_ > 0.0 ? atr_ : config_.default_atr;
    atr_history_.push_back(atr);

    std::vector<double> sorted = atr_history_;
    std::sort(sorted.begin(), sorted.end());
    const double median = sorted[sorted.size() / 2];

    const double multiplier = atr < median ? config_.target_mult_low_vol : config_.target_mult_high_vol;
    return direction == Direction::BUY ? entry + multiplier * atr : entry - multiplier * atr;
}

// ===== Broker orders =====

bool PositionManager::placeEntryOrder(Direction direction, int quantity) {
    execution::MarketOrderRequest request;
    request.symbol = config_.symbol;
    request.side = direction;
    request.quantity = quantity;

    try {
        const std::string order_id = retryWithBackoff(
            [&] { return broker_.placeMarketOrder(request); },
            config_.order_retries, config_.retry_backoff_base, sleeper_, "Entry order");
        LOG_INFO("Entry order {} accepted for {} x{}", order_id, toString(direction), quantity);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Entry order for {} {} x{} failed, position not opened: {}",
                  toString(direction), config_.symbol, quantity, e.what());
        return false;
    }
}

void PositionManager::submitProtectiveStop() {
    execution::StopOrderRequest request;
    request.symbol = config_.symbol;
    request.trade_direction = state_.direction;
    request.quantity = state_.quantity;
    request.trigger_price = state_.stop_loss;

    try {
        state_.stop_order_id = retryWithBackoff(
            [&] { return broker_.submitStopOrder(request); },
            config_.order_retries, config_.retry_backoff_base, sleeper_, "Protective stop");
        LOG_INFO("Protective stop submitted (order {})", state_.stop_order_id);
    } catch (const std::exception& e) {
        LOG_ERROR("Protective stop order failed for trade {}, position is unprotected at the broker: {}",
                  state_.trade_id, e.what());
    }
}

void PositionManager::moveProtectiveStop() {
    if (!config_.submit_orders || state_.stop_order_id.empty()) {
        return;
    }
    try {
        retryWithBackoff(
            [&] { broker_.modifyStopOrder(state_.stop_order_id, state_.stop_loss); },
            config_.order_retries, config_.retry_backoff_base, sleeper_, "Stop modification");
    } catch (const std::exception& e) {
        LOG_ERROR("Broker stop {} still at the old trigger, local SL is {:.2f}: {}",
                  state_.stop_order_id, state_.stop_loss, e.what());
    }
}

// A filled broker stop already flattened the position. Otherwise the working
// stop is cancelled first so it cannot fire after the market exit.
void PositionManager::flattenAtBroker(bool stop_filled) {
    if (!config_.submit_orders) {
        return;
    }
    if (stop_filled && !state_.stop_order_id.empty()) {
        LOG_INFO("Broker stop {} closed the position", state_.stop_order_id);
        return;
    }

    if (!state_.stop_order_id.empty()) {
        try {
            retryWithBackoff(
                [&] { broker_.cancelOrder(state_.stop_order_id); },
                config_.order_retries, config_.retry_backoff_base, sleeper_, "Stop cancellation");
        } catch (const std::exception& e) {
            LOG_ERROR("Could not cancel stop {}: {}", state_.stop_order_id, e.what());
        }
    }

    execution::MarketOrderRequest request;
    request.symbol = config_.symbol;
    request.side = execution::exitSide(state_.direction);
    request.quantity = state_.quantity;
    try {
        const std::string order_id = retryWithBackoff(
            [&] { return broker_.placeMarketOrder(request); },
            config_.order_retries, config_.retry_backoff_base, sleeper_, "Exit order");
        LOG_INFO("Exit order {} sent for trade {}", order_id, state_.trade_id);
    } catch (const std::exception& e) {
        LOG_ERROR("Exit order failed for trade {}, broker position may still be open: {}",
                  state_.trade_id, e.what());
    }
}

// ===== Monitoring =====

TickOutcome PositionManager::monitorTick(const std::vector<IndicatorBar>& bars, TimestampMs now) {
    if (!state_.open) {
        return TickOutcome::NO_POSITION;
    }
    if (bars.empty()) {
        LOG_WARN("No data during monitoring tick");
        return TickOutcome::HOLDING;
    }

    const IndicatorBar& last = bars.back();
    if (last.atr && *last.atr > 0.0) {
        atr_ = *last.atr;
    }
    const double price = last.candle.close;
    LOG_INFO("Price: {:.2f} | SL: {:.2f}", price, state_.stop_loss);

    const double atr = atr_ > 0.0 ? atr_ : config_.default_atr;
    if (trailing_.update(state_, price, atr, now)) {
        moveProtectiveStop();
        persist(makeRecord("Stop-loss trailed", false, 0.0, 0.0, now));
    }

    const bool stop_hit = (state_.direction == Direction::BUY && price < state_.stop_loss) ||
                          (state_.direction == Direction::SELL && price > state_.stop_loss);
    if (stop_hit) {
        LOG_INFO("{}: SL hit at {:.2f}", toString(state_.direction), price);
        closePosition(price, "Stop-loss hit", now, true);
        return TickOutcome::STOP_HIT;
    }

    const long long age_ms = now - state_.entry_time;
    if (!state_.checked_post_entry && age_ms >= config_.health_grace_seconds * 1000) {
        const auto result = postEntryHealthCheck(bars, state_.entry_bar_time,
                                                 config_.health_lookahead, config_.health_threshold_pct);
        if (result.verdict != HealthVerdict::INVALID) {
            state_.checked_post_entry = true;
        }
        if (result.verdict == HealthVerdict::FAILED) {
            LOG_INFO("Weak follow-through after entry ({:.3f}%), exiting early", result.move_pct);
            exitPosition(state_.entry_price, "Weak post-entry momentum", now);
            return TickOutcome::WEAK_FOLLOW_THROUGH;
        }
    }

    return TickOutcome::HOLDING;
}

HealthCheckResult PositionManager::postEntryHealthCheck(const std::vector<IndicatorBar>& bars,
                                                        TimestampMs entry_bar_time,
                                                        int lookahead, double threshold_pct) {
    HealthCheckResult result;

    auto it = std::find_if(bars.begin(), bars.end(),
                           [entry_bar_time](const IndicatorBar& b) { return b.time() == entry_bar_time; });
    if (it == bars.end() || lookahead <= 0) {
        return result;
    }
    const size_t entry_idx = static_cast<size_t>(std::distance(bars.begin(), it));
    if (entry_idx + lookahead >= bars.size()) {
        return result;
    }

    const Candle& entry_bar = it->candle;
    const bool is_buy = entry_bar.close > entry_bar.open;
    const double entry_price = entry_bar.close;
    if (entry_price <= 0.0) {
        return result;
    }

    double best_high = bars[entry_idx + 1].candle.close;
    double best_low = best_high;
    for (size_t i = entry_idx + 1; i <= entry_idx + lookahead; ++i) {
        best_high = std::max(best_high, bars[i].candle.close);
        best_low = std::min(best_low, bars[i].candle.close);
    }

    result.move_pct = is_buy
        ? (best_high - entry_price) / entry_price * 100.0
        : (entry_price - best_low) / entry_price * 100.0;
    result.verdict = result.move_pct >= threshold_pct ? HealthVerdict::PASSED : HealthVerdict::FAILED;
    return result;
}

// ===== Exit =====

std::optional<double> PositionManager::exitPosition(double price, const std::string& reason, TimestampMs now) {
    return closePosition(price, reason, now, false);
}

std::optional<double> PositionManager::closePosition(double price, const std::string& reason, TimestampMs now,
                                                     bool stop_filled) {
    if (!state_.open) {
        LOG_WARN("No open trade to exit");
        return std::nullopt;
    }

    flattenAtBroker(stop_filled);

    const auto charges = calculateCharges(state_.entry_price, price, state_.quantity, state_.direction);
    const double pnl = charges.net_pnl;
    realized_pnl_ += pnl;

    LOG_INFO("Exiting trade at {:.2f} with P&L: {:.2f} ({})", price, pnl, reason);

    persist(makeRecord(reason, true, price, pnl, now));
    Logger::getInstance().logTrade(config_.symbol, std::string("EXIT ") + toString(state_.direction),
                                   price, state_.quantity, pnl);

    state_.last_exit_time = now;
    state_.last_exit_price = price;
    state_.reset();
    return pnl;
}

bool PositionManager::inCooldown(TimestampMs now) const {
    if (!state_.last_exit_time) {
        return false;
    }
    return now - *state_.last_exit_time < config_.cooldown_seconds * 1000;
}

strategy::ReentryContext PositionManager::reentryContext() const {
    strategy::ReentryContext context;
    context.last_exit_time = state_.last_exit_time;
    context.last_exit_price = state_.last_exit_price;
    return context;
}

// ===== Persistence =====

core::TradeRecord PositionManager::makeRecord(const std::string& notes, bool exited, double exit_price,
                                              double pnl, TimestampMs now) const {
    core::TradeRecord record;
    record.trade_id = state_.trade_id;
    record.time = state_.entry_time;
    record.type = state_.direction;
    record.price = state_.entry_price;
    record.sl = state_.stop_loss;
    record.exited = exited;
    record.pnl = pnl;
    record.strategy = toString(state_.strategy);
    record.notes = notes;
    record.symbol = config_.symbol;
    record.exit_price = exit_price;
    record.exit_time = now;
    record.lots = state_.lots;
    return record;
}

void PositionManager::persist(const core::TradeRecord& record) {
    try {
        retryWithBackoff(
            [&] {
                if (!store_.recordTrade(record)) {
                    throw ExternalCallError("store rejected the write");
                }
            },
            config_.store_retries, config_.retry_backoff_base, sleeper_, "Trade store write");
    } catch (const std::exception& e) {
        LOG_ERROR("Trade {} not persisted ({}); in-memory state stays authoritative: {}",
                  record.trade_id, record.notes, e.what());
    }
}

} // namespace risk
} // namespace daypilot
