#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace daypilot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void requireKnownKeys(const nlohmann::json& node, const std::string& where,
                      const std::set<std::string>& known) {
    if (!node.is_object()) {
        throw ConfigError("'" + where + "' must be an object");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (known.count(it.key()) == 0) {
            throw ConfigError("unknown config key '" + where + "." + it.key() + "'");
        }
    }
}

const nlohmann::json& section(const nlohmann::json& root, const std::string& name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    auto it = root.find(name);
    return it == root.end() ? kEmpty : *it;
}

int clockValue(const nlohmann::json& node, const std::string& where, const char* key, int default_minutes) {
    if (!node.contains(key)) {
        return default_minutes;
    }
    const auto parsed = MarketClock::parseClockTime(node.at(key).get<std::string>());
    if (!parsed) {
        throw ConfigError(where + "." + key + " must be HH:MM");
    }
    return *parsed;
}

void requirePositive(double value, const std::string& name) {
    if (!(value > 0.0)) {
        throw ConfigError(name + " must be > 0");
    }
}

void requireFraction(double value, const std::string& name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigError(name + " must be within [0, 1]");
    }
}

// "5minute" -> 300, "minute" -> 60
int intervalSeconds(const std::string& interval) {
    const std::string suffix = "minute";
    if (interval.size() < suffix.size() ||
        interval.compare(interval.size() - suffix.size(), suffix.size(), suffix) != 0) {
        throw ConfigError("trading.interval must look like '5minute'");
    }
    const std::string count = interval.substr(0, interval.size() - suffix.size());
    if (count.empty()) {
        return 60;
    }
    if (!std::all_of(count.begin(), count.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("trading.interval must look like '5minute'");
    }
    const int minutes = std::stoi(count);
    if (minutes <= 0) {
        throw ConfigError("trading.interval must be positive");
    }
    return minutes * 60;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    api_key_.clear();
    engine_config_ = engine::EngineConfig();
    strategy_config_ = strategy::StrategyConfig();
    calendar_config_ = CalendarConfig();
    data_config_ = DataSourceConfig();
    broker_config_ = BrokerConfig();
    store_config_ = StoreConfig();
    logging_config_ = LoggingConfig();
    telegram_config_ = TelegramConfig();
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: symbol=" << engine_config_.symbol
              << ", interval=" << engine_config_.interval << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    reset();

    try {
        requireKnownKeys(j, "<root>", {"trading", "strategy", "breakout", "reversion", "filters",
                                       "health_check", "data", "broker", "store", "logging",
                                       "telegram", "calendar"});

        // ===== trading =====
        const auto& t = section(j, "trading");
        requireKnownKeys(t, "trading", {"symbol", "interval", "trade_qty", "paper_trading",
                                        "weekend_testing", "sleep_interval_seconds", "cooldown_minutes",
                                        "max_daily_loss", "margin_per_lot", "fallback_margin", "min_bars",
                                        "max_data_retries", "late_entry_time", "late_entry_atr_ratio",
                                        "cutoff_time"});
        auto& e = engine_config_;
        e.symbol = t.value("symbol", e.symbol);
        e.interval = t.value("interval", e.interval);
        e.bar_interval_seconds = intervalSeconds(e.interval);
        e.trade_qty = t.value("trade_qty", e.trade_qty);
        e.mode = t.value("paper_trading", true) ? engine::TradingMode::PAPER : engine::TradingMode::LIVE;
        e.weekend_testing = t.value("weekend_testing", false);
        e.sleep_interval_seconds = t.value("sleep_interval_seconds", e.sleep_interval_seconds);
        const int cooldown_minutes = t.value("cooldown_minutes", 15);
        e.cooldown_seconds = static_cast<long long>(cooldown_minutes) * 60;
        e.max_daily_loss = t.value("max_daily_loss", e.max_daily_loss);
        e.margin_per_lot = t.value("margin_per_lot", e.margin_per_lot);
        e.fallback_margin = t.value("fallback_margin", e.fallback_margin);
        e.min_bars = t.value("min_bars", e.min_bars);
        e.max_data_retries = t.value("max_data_retries", e.max_data_retries);
        e.late_entry_minute = clockValue(t, "trading", "late_entry_time", e.late_entry_minute);
        e.late_entry_atr_ratio = t.value("late_entry_atr_ratio", e.late_entry_atr_ratio);
        e.cutoff_minute = clockValue(t, "trading", "cutoff_time", e.cutoff_minute);

        if (e.symbol.empty()) throw ConfigError("trading.symbol must not be empty");
        requirePositive(e.trade_qty, "trading.trade_qty");
        requirePositive(e.sleep_interval_seconds, "trading.sleep_interval_seconds");
        if (cooldown_minutes < 0) throw ConfigError("trading.cooldown_minutes must be >= 0");
        requirePositive(e.max_daily_loss, "trading.max_daily_loss");
        requirePositive(e.margin_per_lot, "trading.margin_per_lot");
        requirePositive(e.fallback_margin, "trading.fallback_margin");
        requirePositive(e.min_bars, "trading.min_bars");
        requirePositive(e.max_data_retries, "trading.max_data_retries");
        requirePositive(e.late_entry_atr_ratio, "trading.late_entry_atr_ratio");

        // ===== strategy =====
        const auto& s = section(j, "strategy");
        requireKnownKeys(s, "strategy", {"mode", "name", "opening_range_start", "opening_range_end",
                                         "min_opening_range", "breakout_volatility_threshold"});
        auto& sel = strategy_config_.selector;
        const std::string mode = toUpperCopy(s.value("mode", std::string("ADAPTIVE")));
        if (mode == "ADAPTIVE") {
            sel.mode = strategy::StrategyMode::ADAPTIVE;
        } else if (mode == "FIXED") {
            sel.mode = strategy::StrategyMode::FIXED;
        } else {
            throw ConfigError("strategy.mode must be ADAPTIVE or FIXED");
        }
        const auto kind = parseStrategyKind(s.value("name", std::string("BREAKOUT")));
        if (!kind) {
            throw ConfigError("strategy.name must be BREAKOUT or REVERSION");
        }
        sel.fixed_strategy = *kind;
        sel.opening_range_start = clockValue(s, "strategy", "opening_range_start", sel.opening_range_start);
        sel.opening_range_end = clockValue(s, "strategy", "opening_range_end", sel.opening_range_end);
        sel.min_opening_range = s.value("min_opening_range", sel.min_opening_range);
        sel.breakout_volatility_threshold =
            s.value("breakout_volatility_threshold", sel.breakout_volatility_threshold);
        if (sel.opening_range_end <= sel.opening_range_start) {
            throw ConfigError("strategy.opening_range_end must be after opening_range_start");
        }

        // ===== breakout =====
        const auto& b = section(j, "breakout");
        requireKnownKeys(b, "breakout", {"entry_buffer", "sl_factor", "target_factor", "min_stop_distance",
                                         "min_atr", "window_start", "window_end"});
        auto& bo = strategy_config_.breakout;
        bo.entry_buffer = b.value("entry_buffer", bo.entry_buffer);
        bo.sl_factor = b.value("sl_factor", bo.sl_factor);
        bo.target_factor = b.value("target_factor", bo.target_factor);
        bo.min_stop_distance = b.value("min_stop_distance", bo.min_stop_distance);
        bo.min_atr = b.value("min_atr", bo.min_atr);
        bo.window_start = clockValue(b, "breakout", "window_start", bo.window_start);
        bo.window_end = clockValue(b, "breakout", "window_end", bo.window_end);
        if (bo.entry_buffer < 0.0) throw ConfigError("breakout.entry_buffer must be >= 0");
        requirePositive(bo.sl_factor, "breakout.sl_factor");
        requirePositive(bo.target_factor, "breakout.target_factor");
        requirePositive(bo.min_stop_distance, "breakout.min_stop_distance");

        // ===== reversion =====
        const auto& r = section(j, "reversion");
        requireKnownKeys(r, "reversion", {"deviation", "sl_mult", "target_mult", "rr_threshold", "min_atr"});
        auto& rv = strategy_config_.reversion;
        rv.deviation = r.value("deviation", rv.deviation);
        rv.sl_mult = r.value("sl_mult", rv.sl_mult);
        rv.target_mult = r.value("target_mult", rv.target_mult);
        rv.rr_threshold = r.value("rr_threshold", rv.rr_threshold);
        rv.min_atr = r.value("min_atr", rv.min_atr);
        requireFraction(rv.deviation, "reversion.deviation");
        requirePositive(rv.sl_mult, "reversion.sl_mult");
        requirePositive(rv.target_mult, "reversion.target_mult");
        requirePositive(rv.rr_threshold, "reversion.rr_threshold");

        // ===== filters =====
        const auto& f = section(j, "filters");
        requireKnownKeys(f, "filters", {"volume_window", "volume_multiplier", "momentum_bars",
                                        "reentry_atr_fraction", "weak_candle_range", "weak_body_ratio"});
        auto& fc = strategy_config_.filters;
        fc.volume_window = f.value("volume_window", fc.volume_window);
        fc.volume_multiplier = f.value("volume_multiplier", fc.volume_multiplier);
        fc.momentum_bars = f.value("momentum_bars", fc.momentum_bars);
        fc.reentry_atr_fraction = f.value("reentry_atr_fraction", fc.reentry_atr_fraction);
        fc.cooldown_seconds = e.cooldown_seconds;
        strategy::CandleQuality quality;
        quality.min_range = f.value("weak_candle_range", quality.min_range);
        quality.min_body_ratio = f.value("weak_body_ratio", quality.min_body_ratio);
        requirePositive(fc.volume_window, "filters.volume_window");
        requirePositive(fc.volume_multiplier, "filters.volume_multiplier");
        requirePositive(fc.momentum_bars, "filters.momentum_bars");
        requirePositive(fc.reentry_atr_fraction, "filters.reentry_atr_fraction");
        requireFraction(quality.min_body_ratio, "filters.weak_body_ratio");
        fc.candle = quality;
        bo.candle = quality;
        rv.candle = quality;

        // ===== health_check =====
        const auto& h = section(j, "health_check");
        requireKnownKeys(h, "health_check", {"lookahead", "threshold_pct", "grace_seconds"});
        e.health.lookahead = h.value("lookahead", e.health.lookahead);
        e.health.threshold_pct = h.value("threshold_pct", e.health.threshold_pct);
        e.health.grace_seconds = h.value("grace_seconds", e.health.grace_seconds);
        requirePositive(e.health.lookahead, "health_check.lookahead");
        if (e.health.grace_seconds < 0) throw ConfigError("health_check.grace_seconds must be >= 0");

        // ===== data =====
        const auto& d = section(j, "data");
        requireKnownKeys(d, "data", {"source", "simulator_url", "replay_file", "lookback_days",
                                     "fetch_retries", "backoff_base_seconds"});
        data_config_.source = d.value("source", data_config_.source);
        data_config_.simulator_url = d.value("simulator_url", data_config_.simulator_url);
        data_config_.replay_file = d.value("replay_file", data_config_.replay_file);
        e.lookback_days = d.value("lookback_days", e.lookback_days);
        e.fetch_retries = d.value("fetch_retries", e.fetch_retries);
        e.backoff_base_seconds = d.value("backoff_base_seconds", e.backoff_base_seconds);
        if (data_config_.source != "simulator" && data_config_.source != "file" &&
            data_config_.source != "kite") {
            throw ConfigError("data.source must be 'simulator', 'file' or 'kite'");
        }
        if (data_config_.source == "file" && data_config_.replay_file.empty()) {
            throw ConfigError("data.replay_file is required when data.source is 'file'");
        }
        requirePositive(e.lookback_days, "data.lookback_days");
        requirePositive(e.fetch_retries, "data.fetch_retries");
        requirePositive(e.backoff_base_seconds, "data.backoff_base_seconds");

        // ===== broker =====
        const auto& br = section(j, "broker");
        requireKnownKeys(br, "broker", {"base_url", "exchange", "product", "token_file", "order_retries"});
        broker_config_.base_url = br.value("base_url", broker_config_.base_url);
        broker_config_.exchange = br.value("exchange", broker_config_.exchange);
        broker_config_.product = br.value("product", broker_config_.product);
        broker_config_.token_file = br.value("token_file", broker_config_.token_file);
        e.order_retries = br.value("order_retries", e.order_retries);
        requirePositive(e.order_retries, "broker.order_retries");

        // ===== store / logging / telegram =====
        const auto& st = section(j, "store");
        requireKnownKeys(st, "store", {"directory", "truncate_on_start", "write_retries"});
        store_config_.directory = st.value("directory", store_config_.directory);
        store_config_.truncate_on_start = st.value("truncate_on_start", store_config_.truncate_on_start);
        e.store_retries = st.value("write_retries", e.store_retries);
        requirePositive(e.store_retries, "store.write_retries");

        const auto& lg = section(j, "logging");
        requireKnownKeys(lg, "logging", {"directory", "level"});
        logging_config_.directory = lg.value("directory", logging_config_.directory);
        logging_config_.level = lg.value("level", logging_config_.level);
        static const std::set<std::string> kLevels = {"trace", "debug", "info", "warning", "warn",
                                                      "error", "critical", "off"};
        if (kLevels.count(logging_config_.level) == 0) {
            throw ConfigError("logging.level is not a known level");
        }

        const auto& tg = section(j, "telegram");
        requireKnownKeys(tg, "telegram", {"enabled", "bot_token", "chat_id"});
        telegram_config_.enabled = tg.value("enabled", false);
        telegram_config_.bot_token = tg.value("bot_token", std::string());
        telegram_config_.chat_id = tg.value("chat_id", std::string());
        if (telegram_config_.enabled &&
            (telegram_config_.bot_token.empty() || telegram_config_.chat_id.empty())) {
            throw ConfigError("telegram.bot_token and telegram.chat_id are required when enabled");
        }

        // ===== calendar =====
        const auto& c = section(j, "calendar");
        requireKnownKeys(c, "calendar", {"utc_offset_minutes", "session_open", "session_close", "holidays"});
        calendar_config_.utc_offset_minutes = c.value("utc_offset_minutes", calendar_config_.utc_offset_minutes);
        calendar_config_.session_open_minute =
            clockValue(c, "calendar", "session_open", calendar_config_.session_open_minute);
        calendar_config_.session_close_minute =
            clockValue(c, "calendar", "session_close", calendar_config_.session_close_minute);
        calendar_config_.weekend_testing = e.weekend_testing;
        if (c.contains("holidays")) {
            for (const auto& item : c.at("holidays")) {
                const auto date = MarketClock::parseDate(item.get<std::string>());
                if (!date) {
                    throw ConfigError("calendar.holidays entries must be YYYY-MM-DD");
                }
                calendar_config_.holidays.insert(*date);
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigError(std::string("config type error: ") + ex.what());
    }

    api_key_ = readEnvVar("DAYPILOT_API_KEY");
}

} // namespace daypilot
