#pragma once

#include <string>

namespace daypilot {
namespace engine {

enum class TradingMode {
    LIVE,           // entry, stop and exit orders go to the broker
    PAPER           // bookkeeping only
};

struct HealthCheckConfig {
    int lookahead = 3;
    double threshold_pct = 0.15;
    long long grace_seconds = 900;
};

struct EngineConfig {
    TradingMode mode;
    std::string symbol;
    std::string interval;
    int bar_interval_seconds;
    int trade_qty;

    int sleep_interval_seconds;
    long long cooldown_seconds;
    double max_daily_loss;

    // lots = max(1, margin / margin_per_lot)
    double margin_per_lot = 250000.0;
    double fallback_margin = 250000.0;

    int min_bars = 15;
    int max_data_retries = 10;
    int lookback_days = 4;
    int fetch_retries = 10;
    double backoff_base_seconds = 3.0;

    // Broker order and trade store attempts; they share the backoff base
    int order_retries = 3;
    int store_retries = 3;

    // After late_entry_minute a new entry needs ATR >= ratio x mean ATR
    int late_entry_minute = 14 * 60 + 30;
    double late_entry_atr_ratio = 1.2;
    int cutoff_minute = 15 * 60 + 25;
    bool weekend_testing = false;

    // Adaptive target multipliers around the running median entry ATR
    double target_mult_low_vol = 1.8;
    double target_mult_high_vol = 2.5;
    double default_atr = 20.0;

    HealthCheckConfig health;

    EngineConfig()
        : mode(TradingMode::PAPER)
        , symbol("BANKNIFTY")
        , interval("5minute")
        , bar_interval_seconds(300)
        , trade_qty(15)
        , sleep_interval_seconds(60)
        , cooldown_seconds(15 * 60)
        , max_daily_loss(5000.0)
    {}
};

} // namespace engine
} // namespace daypilot
