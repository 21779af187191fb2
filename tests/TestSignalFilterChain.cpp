#include "strategy/SignalFilterChain.h"
#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <utility>

using namespace daypilot;
using namespace daypilot::strategy;

// `count` bullish 5-minute bars ending in the signal bar, ATR 20 everywhere
static std::vector<IndicatorBar> series(size_t count, double signal_volume, double prior_volume = 100.0) {
    std::vector<IndicatorBar> bars;
    double price = 21800.0;
    for (size_t i = 0; i < count; ++i) {
        const int minute = 10 * 60 + static_cast<int>(i) * 5;
        const double volume = i + 1 == count ? signal_volume : prior_volume;
        IndicatorBar bar = test::makeBar(test::at(minute / 60, minute % 60), price, price + 15, price - 5,
                                         price + 10, volume);
        bar.atr = 20.0;
        bars.push_back(bar);
        price += 10.0;
    }
    return bars;
}

static TradeDecision buyAt(const std::vector<IndicatorBar>& bars, double entry) {
    const auto& last = bars.back();
    return TradeDecision::valid(Direction::BUY, entry, entry - 20, entry + 80, StrategyKind::REVERSION,
                                last.time());
}

int main() {
    FilterConfig config;
    config.cooldown_seconds = 5 * 60;
    const SignalFilterChain chain(config);
    const ReentryContext no_history;

    // Strong volume and aligned momentum pass
    {
        const auto bars = series(20, 200.0);
        const auto d = chain.apply(buyAt(bars, 22000.0), bars, bars.size() - 1, no_history);
        assert(d.isValid());
    }

    // Volume equal to the prior average is rejected, the average excludes the signal bar
    {
        const auto bars = series(20, 100.0);
        const auto d = chain.apply(buyAt(bars, 22000.0), bars, bars.size() - 1, no_history);
        assert(!d.isValid());
        assert(d.reason == "Volume too low: 100 <= 1.2x avg (100)");
        assert(d.signal == Direction::BUY);

        const auto just_enough = series(20, 121.0);
        assert(chain.apply(buyAt(just_enough, 22000.0), just_enough, 19, no_history).isValid());
        const auto just_short = series(20, 119.0);
        assert(!chain.apply(buyAt(just_short, 22000.0), just_short, 19, no_history).isValid());
    }

    // Fewer than 14 prior bars
    {
        const auto bars = series(10, 500.0);
        const auto reason = chain.checkVolume(bars, 9);
        assert(reason && *reason == "Volume too low: 500, fewer than 14 prior bars");
        assert(chain.checkVolume(series(15, 500.0), 14) == std::nullopt);
    }

    // Momentum: all three previous candles must agree with the signal
    {
        auto bars = series(20, 200.0);
        assert(!chain.checkMomentum(bars, 19, Direction::BUY));
        assert(chain.checkMomentum(bars, 19, Direction::SELL));

        std::swap(bars[17].candle.open, bars[17].candle.close);
        const auto d = chain.apply(buyAt(bars, 22000.0), bars, 19, no_history);
        assert(d.reason == "Weak momentum across last 3 candles");
        // the signal bar itself is not part of the momentum window
        auto mixed = series(20, 200.0);
        std::swap(mixed[19].candle.open, mixed[19].candle.close);
        assert(!chain.checkMomentum(mixed, 19, Direction::BUY));
    }

    // Weak candle right after an exit
    {
        auto bars = series(20, 200.0);
        bars[19].candle.high = bars[19].candle.low + 3.0;
        ReentryContext reentry;
        reentry.last_exit_time = bars[19].time() - 60 * 1000;
        reentry.last_exit_price = 21000.0;
        const auto d = chain.apply(buyAt(bars, 22000.0), bars, 19, reentry);
        assert(d.reason == "Weak post-cooldown candle");

        // same candle with no prior exit is fine here
        assert(chain.apply(buyAt(bars, 22000.0), bars, 19, no_history).isValid());
    }

    // Same zone: 60 s after an exit 0.3 ATR away
    {
        const auto bars = series(20, 200.0);
        ReentryContext reentry;
        reentry.last_exit_time = bars[19].time() - 60 * 1000;
        reentry.last_exit_price = 22000.0 + 0.3 * 20.0;
        const auto d = chain.apply(buyAt(bars, 22000.0), bars, 19, reentry);
        assert(d.reason == "Same-zone reentry");

        // after the cooldown the zone check no longer applies, pullback does
        reentry.last_exit_time = bars[19].time() - 10 * 60 * 1000;
        assert(chain.apply(buyAt(bars, 22000.0), bars, 19, reentry).reason == "No pullback for re-entry");
    }

    // Pullback: a buy needs entry above last exit + 0.5 ATR
    {
        const auto bars = series(20, 200.0);
        ReentryContext reentry;
        reentry.last_exit_time = bars[19].time() - 3600 * 1000;
        reentry.last_exit_price = 21995.0;
        assert(chain.apply(buyAt(bars, 22000.0), bars, 19, reentry).reason == "No pullback for re-entry");

        reentry.last_exit_price = 21980.0;
        assert(chain.apply(buyAt(bars, 22000.0), bars, 19, reentry).isValid());

        assert(chain.checkPullback(21975.0, 20.0, Direction::SELL, reentry));
        assert(!chain.checkPullback(21965.0, 20.0, Direction::SELL, reentry));
    }

    // Re-entry checks need the signal bar's ATR
    {
        auto bars = series(20, 200.0);
        bars[19].atr.reset();
        ReentryContext reentry;
        reentry.last_exit_time = bars[19].time() - 3600 * 1000;
        reentry.last_exit_price = 21000.0;
        assert(chain.apply(buyAt(bars, 22000.0), bars, 19, reentry).reason == "Missing ATR for re-entry checks");
    }

    // Rejected decisions pass through untouched
    {
        const auto bars = series(20, 100.0);
        const auto rejected = TradeDecision::rejected(StrategyKind::BREAKOUT, "No breakout conditions met");
        const auto d = chain.apply(rejected, bars, 19, no_history);
        assert(d.reason == "No breakout conditions met");
    }

    std::cout << "[TEST] SignalFilterChain PASSED\n";
    return 0;
}
