#include "risk/PositionManager.h"
#include "risk/TransactionCosts.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace daypilot;
using namespace daypilot::risk;

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

static strategy::TradeDecision decision(Direction side, double entry, double stop, TimestampMs bar_time) {
    const double target = side == Direction::BUY ? entry + 100 : entry - 100;
    return strategy::TradeDecision::valid(side, entry, stop, target, StrategyKind::BREAKOUT, bar_time);
}

static PositionConfig testConfig() {
    PositionConfig pc;
    pc.symbol = "BANKNIFTY";
    pc.trade_qty = 25;
    pc.submit_orders = true;
    pc.cooldown_seconds = 300;
    return pc;
}

// Bullish entry bar at 10:00 followed by `after` closes, 5 minutes apart
static std::vector<IndicatorBar> entryBars(const std::vector<double>& after) {
    std::vector<IndicatorBar> bars;
    IndicatorBar entry = test::makeBar(test::at(10, 0), 21980, 22010, 21975, 22000);
    entry.atr = 20.0;
    bars.push_back(entry);
    for (size_t i = 0; i < after.size(); ++i) {
        const int minute = 10 * 60 + 5 * static_cast<int>(i + 1);
        IndicatorBar bar = test::makeBar(test::at(minute / 60, minute % 60), after[i] - 2, after[i] + 5,
                                         after[i] - 5, after[i]);
        bar.atr = 20.0;
        bars.push_back(bar);
    }
    return bars;
}

static void testNetPnl() {
    assert(near(calculateNetPnl(22000, 22050, 25, Direction::BUY), 1185.20));
    assert(near(calculateNetPnl(22050, 22000, 25, Direction::SELL), 1064.20));

    const auto c = calculateCharges(22000, 22050, 25, Direction::BUY);
    assert(near(c.gross_pnl, 1250.0));
    assert(near(c.brokerage, 40.0));
    assert(near(c.stt, 0.0));
    assert(near(c.stamp, 16.5));
    assert(calculateNetPnl(22000, 21950, 25, Direction::BUY) < -1250.0);
}

static void testLifecycle() {
    TradeState state;
    test::RecordingBroker broker;
    test::InMemoryTradeStore store;
    const TrailingStopManager trailing;
    PositionManager pm(state, broker, store, trailing, testConfig());

    const TimestampMs t0 = test::at(10, 0);
    assert(!pm.hasOpenPosition());
    assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
    assert(state.open && pm.hasOpenPosition());
    assert(state.quantity == 25 && state.lots == 1);
    assert(state.entry_time == t0 && state.entry_bar_time == t0);
    // single entry: median 20, ATR not below it -> 2.5 x ATR
    assert(near(state.target_price, 22050.0));
    assert(state.trade_id.size() == 36);

    // market entry on the trade side, then the protective stop
    assert(broker.market_orders.size() == 1);
    assert(broker.market_orders[0].side == Direction::BUY);
    assert(broker.market_orders[0].quantity == 25);
    assert(broker.stop_orders.size() == 1);
    assert(broker.stop_orders[0].trade_direction == Direction::BUY);
    assert(execution::exitSide(broker.stop_orders[0].trade_direction) == Direction::SELL);
    assert(near(broker.stop_orders[0].trigger_price, 21960.0));
    assert(state.stop_order_id == "STOP-1");
    assert(store.countNotes("Order placed") == 1);

    // at most one open trade
    const std::string first_id = state.trade_id;
    assert(!pm.openPosition(decision(Direction::SELL, 22000, 22040, t0), 1, 20.0, t0));
    assert(state.trade_id == first_id && state.direction == Direction::BUY);
    assert(broker.market_orders.size() == 1 && broker.stop_orders.size() == 1);

    const TimestampMs t1 = t0 + 10 * 60 * 1000;
    const auto pnl = pm.exitPosition(22050, "Target reached", t1);
    assert(pnl && near(*pnl, 1185.20));
    assert(!state.open);
    assert(state.stop_order_id.empty());

    // the working stop is cancelled before the market square-off
    assert(broker.cancels.size() == 1 && broker.cancels[0] == "STOP-1");
    assert(broker.market_orders.size() == 2);
    assert(broker.market_orders[1].side == Direction::SELL);
    assert(broker.market_orders[1].quantity == 25);
    assert(state.last_exit_time && *state.last_exit_time == t1);
    assert(state.last_exit_price && near(*state.last_exit_price, 22050.0));
    assert(store.rows.back().exited && near(store.rows.back().pnl, 1185.20));
    assert(store.rows.back().trade_id == first_id);
    assert(near(pm.realizedPnl(), 1185.20));

    assert(!pm.exitPosition(22000, "again", t1));

    // cooldown counts from the exit
    assert(pm.inCooldown(t1 + 60 * 1000));
    assert(!pm.inCooldown(t1 + 301 * 1000));
    const auto reentry = pm.reentryContext();
    assert(reentry.last_exit_time && *reentry.last_exit_time == t1);

    // SELL round trip; ATR history [20, 30] -> median 30, not below -> 2.5x
    const TimestampMs t2 = t1 + 30 * 60 * 1000;
    assert(pm.openPosition(decision(Direction::SELL, 22050, 22090, t2), 1, 30.0, t2));
    assert(near(state.target_price, 22050.0 - 75.0));
    assert(broker.market_orders.back().side == Direction::SELL);
    assert(broker.stop_orders.back().trade_direction == Direction::SELL);
    const auto sell_pnl = pm.exitPosition(22000, "Target reached", t2 + 60 * 1000);
    assert(sell_pnl && near(*sell_pnl, 1064.20));
    assert(broker.market_orders.back().side == Direction::BUY);
    assert(broker.cancels.back() == "STOP-2");

    // ATR history [20, 30, 10] -> median 20, 10 is below -> 1.8x
    const TimestampMs t3 = t2 + 60 * 60 * 1000;
    assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t3), 2, 10.0, t3));
    assert(near(state.target_price, 22018.0));
    assert(state.quantity == 50);
    assert(pm.atrHistory().size() == 3);
}

static void testRefusals() {
    TradeState state;
    test::RecordingBroker broker;
    test::InMemoryTradeStore store;
    const TrailingStopManager trailing;
    PositionManager pm(state, broker, store, trailing, testConfig());

    const TimestampMs t0 = test::at(10, 0);
    assert(!pm.openPosition(strategy::TradeDecision::rejected(StrategyKind::BREAKOUT, "nope"), 1, 20.0, t0));
    assert(!pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 0, 20.0, t0));
    assert(!state.open && store.rows.empty());
    assert(broker.order_calls == 0);

    // a rejected entry order leaves the manager flat
    broker.reject_market_orders = true;
    assert(!pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
    assert(!state.open && state.trade_id.empty());
    assert(store.rows.empty() && broker.stop_orders.empty());
    assert(pm.atrHistory().empty());
    broker.reject_market_orders = false;

    // stop and store failures after the fill do not roll back the position
    broker.reject_stop_orders = true;
    store.fail_writes = true;
    assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
    assert(state.open);
    assert(state.stop_order_id.empty());

    // without a working stop the exit is a plain market order
    assert(pm.exitPosition(21990, "Manual", t0 + 1000));
    assert(!state.open);
    assert(broker.cancels.empty());
    assert(broker.market_orders.size() == 2);
    assert(broker.market_orders.back().side == Direction::SELL);
}

static void testTransientFailuresAreRetried() {
    PositionConfig pc = testConfig();
    pc.order_retries = 3;
    pc.store_retries = 3;
    pc.retry_backoff_base = 2.0;
    const TimestampMs t0 = test::at(10, 0);

    // broker and store each fail once, then succeed
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        test::RecordingSleeper sleeper;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc, sleeper.fn());

        broker.failures_remaining = 1;
        store.failures_remaining = 1;
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        assert(state.open);

        assert(broker.order_calls == 3);
        assert(broker.market_orders.size() == 1);
        assert(broker.stop_orders.size() == 1);
        assert(state.stop_order_id == "STOP-1");

        assert(store.write_calls == 2);
        assert(store.rows.size() == 1);
        assert(store.rows[0].notes == "Order placed");

        // first backoff is base^0 seconds
        assert(sleeper.delays_ms.size() == 2);
        assert(sleeper.delays_ms[0] == 1000 && sleeper.delays_ms[1] == 1000);

        // exit path: cancel fails once, the market exit still goes out
        broker.failures_remaining = 1;
        assert(pm.exitPosition(22010, "Manual", t0 + 60 * 1000));
        assert(broker.cancels.size() == 1);
        assert(broker.market_orders.size() == 2);
        assert(store.rows.back().exited);
    }

    // an entry that keeps failing is abandoned after the configured attempts
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        test::RecordingSleeper sleeper;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc, sleeper.fn());

        broker.failures_remaining = 10;
        assert(!pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        assert(!state.open);
        assert(broker.order_calls == 3);
        assert(store.write_calls == 0);
        assert(sleeper.delays_ms.size() == 2);
        assert(sleeper.delays_ms[0] == 1000 && sleeper.delays_ms[1] == 2000);
    }
}

static void testBrokerStopFollowsTrade() {
    PositionConfig pc = testConfig();
    const TimestampMs t0 = test::at(10, 0);

    // trailing moves the broker stop; a stop hit leaves the broker alone
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));

        assert(pm.monitorTick(entryBars({22025}), t0 + 300 * 1000) == TickOutcome::HOLDING);
        assert(broker.modifications.size() == 1);
        assert(broker.modifications[0].first == "STOP-1");
        assert(near(broker.modifications[0].second, 22013.0));

        assert(pm.monitorTick(entryBars({22025, 22010}), t0 + 360 * 1000) == TickOutcome::STOP_HIT);
        assert(!state.open);
        assert(broker.cancels.empty());
        assert(broker.market_orders.size() == 1);
    }

    // weak follow-through is a managed exit: cancel, then square off
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::SELL, 22000, 22040, t0), 1, 20.0, t0));
        assert(broker.market_orders[0].side == Direction::SELL);

        auto bars = entryBars({22005, 21998, 22003});
        bars[0].candle.open = 22020;
        assert(pm.monitorTick(bars, t0 + 901 * 1000) == TickOutcome::WEAK_FOLLOW_THROUGH);
        assert(broker.cancels.size() == 1 && broker.cancels[0] == "STOP-1");
        assert(broker.market_orders.size() == 2);
        assert(broker.market_orders[1].side == Direction::BUY);
    }

    // paper mode never touches the broker
    {
        pc.submit_orders = false;
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        assert(pm.monitorTick(entryBars({22025}), t0 + 300 * 1000) == TickOutcome::HOLDING);
        assert(pm.exitPosition(22030, "Manual", t0 + 400 * 1000));
        assert(broker.order_calls == 0);
    }
}

static void testMonitoring() {
    PositionConfig pc = testConfig();
    const TimestampMs t0 = test::at(10, 0);

    // Stop hit on the latest close
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        const auto bars = entryBars({21980, 21955});
        assert(pm.monitorTick(bars, t0 + 60 * 1000) == TickOutcome::STOP_HIT);
        assert(!state.open);
        assert(store.rows.back().notes == "Stop-loss hit");
        assert(store.rows.back().pnl < 0.0);
        assert(pm.monitorTick(bars, t0 + 120 * 1000) == TickOutcome::NO_POSITION);
    }

    // Sell stop is hit when the price rises above it
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::SELL, 22000, 22040, t0), 1, 20.0, t0));
        assert(pm.monitorTick(entryBars({22030}), t0 + 60 * 1000) == TickOutcome::HOLDING);
        assert(pm.monitorTick(entryBars({22030, 22045}), t0 + 90 * 1000) == TickOutcome::STOP_HIT);
    }

    // Weak follow-through after the grace period exits at the entry price
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));

        // within the grace period nothing happens
        assert(pm.monitorTick(entryBars({22005, 22010, 22003}), t0 + 600 * 1000) == TickOutcome::HOLDING);
        assert(!state.checked_post_entry);

        // not enough bars after entry yet: stays unchecked and is retried
        assert(pm.monitorTick(entryBars({22005, 22010}), t0 + 901 * 1000) == TickOutcome::HOLDING);
        assert(state.open && !state.checked_post_entry);

        assert(pm.monitorTick(entryBars({22005, 22010, 22003}), t0 + 960 * 1000) ==
               TickOutcome::WEAK_FOLLOW_THROUGH);
        assert(!state.open);
        assert(store.rows.back().notes == "Weak post-entry momentum");
        assert(near(store.rows.back().exit_price, 22000.0));
    }

    // Healthy follow-through marks the check done and keeps the trade
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        assert(pm.monitorTick(entryBars({22010, 22040, 22015}), t0 + 901 * 1000) == TickOutcome::HOLDING);
        assert(state.open && state.checked_post_entry);
    }

    // Trailing updates are persisted
    {
        TradeState state;
        test::RecordingBroker broker;
        test::InMemoryTradeStore store;
        const TrailingStopManager trailing;
        PositionManager pm(state, broker, store, trailing, pc);
        assert(pm.openPosition(decision(Direction::BUY, 22000, 21960, t0), 1, 20.0, t0));
        assert(pm.monitorTick(entryBars({22025}), t0 + 300 * 1000) == TickOutcome::HOLDING);
        assert(near(state.stop_loss, 22013.0));
        assert(state.last_sl_update_time && *state.last_sl_update_time == t0 + 300 * 1000);
        assert(store.countNotes("Stop-loss trailed") == 1);
    }
}

static void testHealthCheck() {
    const auto entry_time = test::at(10, 0);

    // 0.15% of 22000 is 33 points
    auto r = PositionManager::postEntryHealthCheck(entryBars({22010, 22040, 22020}), entry_time, 3, 0.15);
    assert(r.verdict == HealthVerdict::PASSED);
    assert(near(r.move_pct, 40.0 / 22000.0 * 100.0));

    r = PositionManager::postEntryHealthCheck(entryBars({22010, 22030, 22020}), entry_time, 3, 0.15);
    assert(r.verdict == HealthVerdict::FAILED);

    // adverse move counts as negative excursion
    r = PositionManager::postEntryHealthCheck(entryBars({21990, 21980, 21970}), entry_time, 3, 0.15);
    assert(r.verdict == HealthVerdict::FAILED);
    assert(r.move_pct < 0.0);

    r = PositionManager::postEntryHealthCheck(entryBars({22010, 22040}), entry_time, 3, 0.15);
    assert(r.verdict == HealthVerdict::INVALID);

    r = PositionManager::postEntryHealthCheck(entryBars({22010, 22040, 22020}), entry_time + 1, 3, 0.15);
    assert(r.verdict == HealthVerdict::INVALID);

    // bearish entry bar is judged as a short
    auto bars = entryBars({21960, 21990, 21995});
    bars[0].candle.close = 22000;
    bars[0].candle.open = 22020;
    r = PositionManager::postEntryHealthCheck(bars, entry_time, 3, 0.15);
    assert(r.verdict == HealthVerdict::PASSED);
}

int main() {
    testNetPnl();
    testLifecycle();
    testRefusals();
    testTransientFailuresAreRetried();
    testBrokerStopFollowsTrade();
    testMonitoring();
    testHealthCheck();
    std::cout << "[TEST] PositionManager PASSED\n";
    return 0;
}
