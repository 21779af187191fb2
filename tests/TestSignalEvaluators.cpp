#include "strategy/BreakoutStrategy.h"
#include "strategy/MeanReversionStrategy.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace daypilot;
using namespace daypilot::strategy;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

static IndicatorBar breakoutBar(TimestampMs ts, double open, double high, double low, double close,
                                double prev_open, double prev_close) {
    IndicatorBar bar = test::makeBar(ts, open, high, low, close);
    bar.atr = 30.0;
    bar.open_prev_1 = prev_open;
    bar.close_prev_1 = prev_close;
    bar.breakout_long_entry = 22020.0;
    bar.breakout_short_entry = 21980.0;
    bar.breakout_stop_distance = 45.0;
    bar.breakout_target_distance = 180.0;
    return bar;
}

static IndicatorBar reversionBar(double open, double high, double low, double close,
                                 double prev_close, double typical, double ema_long) {
    IndicatorBar bar = test::makeBar(test::at(11, 0), open, high, low, close);
    bar.typical_price = typical;
    bar.ema_long = ema_long;
    bar.atr = 20.0;
    bar.rsi = 55.0;
    bar.close_prev_1 = prev_close;
    return bar;
}

static void testBreakout() {
    const BreakoutStrategy strategy(BreakoutStrategyConfig(), test::ist());
    assert(strategy.kind() == StrategyKind::BREAKOUT);

    // Long: high through the long level after a bullish candle
    {
        const std::vector<IndicatorBar> bars = {
            breakoutBar(test::at(10, 0), 22010, 22040, 22005, 22035, 22000, 22010)};
        const auto d = strategy.evaluate(bars, 0);
        assert(d.isValid());
        assert(d.signal == Direction::BUY);
        assert(near(d.entry_price, 22035.0));
        assert(near(d.stop_loss, 21990.0));
        assert(near(d.target, 22215.0));
        assert(d.strategy == StrategyKind::BREAKOUT);
        assert(d.bar_time == test::at(10, 0));
    }

    // Short: low through the short level after a bearish candle
    {
        const std::vector<IndicatorBar> bars = {
            breakoutBar(test::at(10, 0), 21990, 21995, 21960, 21965, 22000, 21990)};
        const auto d = strategy.evaluate(bars, 0);
        assert(d.isValid());
        assert(d.signal == Direction::SELL);
        assert(near(d.stop_loss, 22010.0));
        assert(near(d.target, 21785.0));
    }

    // Level touched but the previous candle disagrees
    {
        const std::vector<IndicatorBar> bars = {
            breakoutBar(test::at(10, 0), 22010, 22040, 22005, 22035, 22010, 22000)};
        const auto d = strategy.evaluate(bars, 0);
        assert(!d.isValid());
        assert(d.reason == "No breakout conditions met");
    }

    // Window bounds are inclusive
    {
        const std::vector<IndicatorBar> bars = {
            breakoutBar(test::at(9, 25), 22010, 22040, 22005, 22035, 22000, 22010),
            breakoutBar(test::at(9, 30), 22010, 22040, 22005, 22035, 22000, 22010),
            breakoutBar(test::at(15, 25), 22010, 22040, 22005, 22035, 22000, 22010),
            breakoutBar(test::at(15, 25, 15, 1), 22010, 22040, 22005, 22035, 22000, 22010)};
        assert(strategy.evaluate(bars, 0).reason == "Outside trading window");
        assert(strategy.evaluate(bars, 1).isValid());
        assert(strategy.evaluate(bars, 2).isValid());
        assert(strategy.evaluate(bars, 3).reason == "Outside trading window");
    }

    // Weak candle: range 3
    {
        const std::vector<IndicatorBar> bars = {
            breakoutBar(test::at(10, 0), 22000, 22003, 22000, 22002, 22000, 22010)};
        const auto d = strategy.evaluate(bars, 0);
        assert(d.status == DecisionStatus::REJECTED);
        assert(startsWith(d.reason, "Weak candle"));
    }

    // ATR gate
    {
        auto bar = breakoutBar(test::at(10, 0), 22010, 22040, 22005, 22035, 22000, 22010);
        bar.atr = 5.0;
        assert(strategy.evaluate({bar}, 0).reason == "ATR 5.00 < 10");
        bar.atr.reset();
        assert(strategy.evaluate({bar}, 0).reason == "ATR missing");
    }

    // Empty or zeroed levels are both missing
    {
        auto bar = breakoutBar(test::at(10, 0), 22010, 22040, 22005, 22035, 22000, 22010);
        bar.breakout_long_entry = 0.0;
        assert(strategy.evaluate({bar}, 0).reason == "Missing breakout levels");
        bar.breakout_long_entry = 22020.0;
        bar.breakout_target_distance.reset();
        assert(strategy.evaluate({bar}, 0).reason == "Missing breakout levels");
    }

    // Out of range index is a data error, never a signal
    {
        const std::vector<IndicatorBar> bars;
        const auto d = strategy.evaluate(bars, 0);
        assert(d.isDataError());
        assert(d.signal == Direction::NONE);
    }
}

static void testReversion() {
    const MeanReversionStrategy strategy{ReversionStrategyConfig()};
    assert(strategy.kind() == StrategyKind::REVERSION);

    // Cross above the upper band with the trend
    {
        const auto bar = reversionBar(22020, 22055, 22015, 22050, 22010, 22000, 21990);
        const auto d = strategy.evaluate({bar}, 0);
        assert(d.isValid());
        assert(d.signal == Direction::BUY);
        assert(near(d.entry_price, 22050.0));
        assert(near(d.stop_loss, 22034.0));
        assert(near(d.target, 22130.0));
        assert(d.strategy == StrategyKind::REVERSION);
    }

    // Cross below the lower band with the trend
    {
        const auto bar = reversionBar(21980, 21985, 21945, 21950, 21990, 22000, 22010);
        const auto d = strategy.evaluate({bar}, 0);
        assert(d.isValid());
        assert(d.signal == Direction::SELL);
        assert(near(d.stop_loss, 21966.0));
        assert(near(d.target, 21870.0));
    }

    // Already above the band on the previous bar -> no cross
    {
        const auto bar = reversionBar(22020, 22055, 22015, 22050, 22030, 22000, 21990);
        assert(strategy.evaluate({bar}, 0).reason == "No reversion signal conditions met");
    }

    // Trend filter blocks a buy below the long EMA
    {
        const auto bar = reversionBar(22020, 22055, 22015, 22050, 22010, 22000, 22100);
        assert(!strategy.evaluate({bar}, 0).isValid());
    }

    // Missing inputs
    {
        auto bar = reversionBar(22020, 22055, 22015, 22050, 22010, 22000, 21990);
        bar.rsi.reset();
        assert(strategy.evaluate({bar}, 0).reason == "Missing indicator value(s)");
        bar.atr.reset();
        assert(strategy.evaluate({bar}, 0).reason == "Missing entry or ATR");
    }

    // Low ATR
    {
        auto bar = reversionBar(22020, 22055, 22015, 22050, 22010, 22000, 21990);
        bar.atr = 3.0;
        assert(strategy.evaluate({bar}, 0).reason == "ATR too low 3.00 < 5");
    }

    // Weak candle
    {
        const auto bar = reversionBar(22048, 22051, 22048, 22050, 22010, 22000, 21990);
        assert(startsWith(strategy.evaluate({bar}, 0).reason, "Weak candle"));
    }

    // Risk/reward gate with a 1:1 setup
    {
        ReversionStrategyConfig config;
        config.sl_mult = 1.0;
        config.target_mult = 1.0;
        const MeanReversionStrategy tight(config);
        const auto bar = reversionBar(22020, 22055, 22015, 22050, 22010, 22000, 21990);
        const auto d = tight.evaluate({bar}, 0);
        assert(!d.isValid());
        assert(d.reason == "Risk/reward too low 20.00 < 24.00");
    }
}

int main() {
    testBreakout();
    testReversion();
    std::cout << "[TEST] SignalEvaluators PASSED\n";
    return 0;
}
