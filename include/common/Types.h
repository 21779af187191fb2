#pragma once

#include <string>
#include <vector>
#include <optional>

namespace daypilot {

// Epoch milliseconds (UTC). 0 means "could not be resolved".
using TimestampMs = long long;
using Price = double;
using Quantity = int;

enum class Direction { NONE, BUY, SELL };
enum class StrategyKind { BREAKOUT, REVERSION };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    double body() const;
    double range() const;
    bool isBullish() const { return close > open; }
    bool isBearish() const { return close < open; }
};

// Candle + indicator set + strategy levels. Optional fields are empty during
// warm-up or when a level was never assigned for the bar's date.
struct IndicatorBar {
    Candle candle;

    double ema_short = 0.0;     // EMA span 5
    double ema_long = 0.0;      // EMA span 20
    double macd = 0.0;          // EMA12 - EMA26
    double typical_price = 0.0; // (H + L + C) / 3
    std::optional<double> rsi;
    std::optional<double> atr;

    std::optional<double> open_prev_1;
    std::optional<double> close_prev_1;
    std::optional<double> open_prev_2;
    std::optional<double> close_prev_2;

    std::optional<double> breakout_long_entry;
    std::optional<double> breakout_short_entry;
    std::optional<double> breakout_stop_distance;
    std::optional<double> breakout_target_distance;

    TimestampMs time() const { return candle.timestamp; }
};

const char* toString(Direction direction);
const char* toString(StrategyKind kind);
std::optional<Direction> parseDirection(const std::string& text);
std::optional<StrategyKind> parseStrategyKind(const std::string& text);

// Rounds half away from zero to 2 decimals.
double roundTo2(double value);

} // namespace daypilot
