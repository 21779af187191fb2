#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace daypilot;

static bool rejects(const nlohmann::json& j) {
    try {
        Config::getInstance().loadFromJson(j);
    } catch (const ConfigError& e) {
        std::cout << "[TEST] rejected as expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;
    Config& config = Config::getInstance();

    // Defaults
    config.loadFromJson(nlohmann::json::object());
    {
        const auto e = config.getEngineConfig();
        assert(e.symbol == "BANKNIFTY");
        assert(e.interval == "5minute" && e.bar_interval_seconds == 300);
        assert(e.mode == engine::TradingMode::PAPER);
        assert(e.cooldown_seconds == 15 * 60);
        assert(e.late_entry_minute == 14 * 60 + 30);
        assert(e.cutoff_minute == 15 * 60 + 25);
        assert(e.health.grace_seconds == 900);
        assert(e.order_retries == 3 && e.store_retries == 3);

        const auto s = config.getStrategyConfig();
        assert(s.selector.mode == strategy::StrategyMode::ADAPTIVE);
        assert(s.selector.opening_range_start == 9 * 60 + 15);
        assert(s.filters.volume_window == 14);
        assert(std::fabs(s.reversion.sl_mult - 0.8) < 1e-12);

        const auto c = config.getCalendarConfig();
        assert(c.utc_offset_minutes == 330);
        assert(c.holidays.empty());
        assert(config.getDataSourceConfig().source == "simulator");
        assert(!config.getTelegramConfig().enabled);
    }

    // Overrides flow to every consumer
    {
        const auto j = nlohmann::json::parse(R"({
            "trading": {"symbol": "NIFTY", "interval": "minute", "paper_trading": false,
                        "cooldown_minutes": 5, "cutoff_time": "15:00", "weekend_testing": true},
            "strategy": {"mode": "fixed", "name": "reversion"},
            "filters": {"weak_candle_range": 8, "weak_body_ratio": 0.3},
            "data": {"source": "file", "replay_file": "bars.json"},
            "broker": {"order_retries": 5},
            "store": {"write_retries": 2},
            "calendar": {"holidays": ["2024-01-26", "2024-03-08"]}
        })");
        config.loadFromJson(j);

        const auto e = config.getEngineConfig();
        assert(e.symbol == "NIFTY");
        assert(e.bar_interval_seconds == 60);
        assert(e.mode == engine::TradingMode::LIVE);
        assert(e.cooldown_seconds == 300);
        assert(e.cutoff_minute == 900);
        assert(e.weekend_testing);
        assert(e.order_retries == 5 && e.store_retries == 2);

        const auto s = config.getStrategyConfig();
        assert(s.filters.cooldown_seconds == 300);
        assert(s.selector.mode == strategy::StrategyMode::FIXED);
        assert(s.selector.fixed_strategy == StrategyKind::REVERSION);
        assert(std::fabs(s.breakout.candle.min_range - 8.0) < 1e-12);
        assert(std::fabs(s.reversion.candle.min_body_ratio - 0.3) < 1e-12);
        assert(std::fabs(s.filters.candle.min_range - 8.0) < 1e-12);

        const auto c = config.getCalendarConfig();
        assert(c.weekend_testing);
        assert(c.holidays.count(20240126) == 1 && c.holidays.size() == 2);
        assert(config.getDataSourceConfig().replay_file == "bars.json");
    }

    // Historical bars straight from Kite
    config.loadFromJson({{"data", {{"source", "kite"}}}});
    assert(config.getDataSourceConfig().source == "kite");

    // Reload resets to defaults
    config.loadFromJson(nlohmann::json::object());
    assert(config.getEngineConfig().symbol == "BANKNIFTY");
    assert(config.getCalendarConfig().holidays.empty());

    // Rejections
    assert(rejects({{"tradng", nlohmann::json::object()}}));
    assert(rejects({{"trading", {{"max_loss", 100}}}}));
    assert(rejects({{"trading", {{"trade_qty", "ten"}}}}));
    assert(rejects({{"trading", {{"trade_qty", 0}}}}));
    assert(rejects({{"trading", {{"interval", "5hour"}}}}));
    assert(rejects({{"trading", {{"cutoff_time", "3pm"}}}}));
    assert(rejects({{"strategy", {{"mode", "RANDOM"}}}}));
    assert(rejects({{"strategy", {{"name", "MOMENTUM"}}}}));
    assert(rejects({{"strategy", {{"opening_range_start", "09:30"}, {"opening_range_end", "09:15"}}}}));
    assert(rejects({{"filters", {{"weak_body_ratio", 1.5}}}}));
    assert(rejects({{"data", {{"source", "file"}}}}));
    assert(rejects({{"data", {{"source", "yahoo"}}}}));
    assert(rejects({{"broker", {{"order_retries", 0}}}}));
    assert(rejects({{"store", {{"write_retries", -1}}}}));
    assert(rejects({{"telegram", {{"enabled", true}}}}));
    assert(rejects({{"calendar", {{"holidays", {"26-01-2024"}}}}}));
    assert(rejects({{"logging", {{"level", "loud"}}}}));

    // Missing file
    {
        const auto missing = std::filesystem::temp_directory_path() / "daypilot_no_such_config.json";
        bool threw = false;
        try {
            config.load(missing.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // Unparseable file
    {
        const auto broken = std::filesystem::temp_directory_path() / "daypilot_broken_config.json";
        {
            std::ofstream out(broken);
            out << "{ \"trading\": ";
        }
        bool threw = false;
        try {
            config.load(broken.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
        std::filesystem::remove(broken);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
