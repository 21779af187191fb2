#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/MarketClock.h"
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace daypilot {

struct DataSourceConfig {
    std::string source = "simulator";        // "simulator" | "file" | "kite"
    std::string simulator_url = "http://localhost:8000";
    std::string replay_file;
};

// Also used by the "kite" data source
struct BrokerConfig {
    std::string base_url = "https://api.kite.trade";
    std::string exchange = "NFO";
    std::string product = "MIS";
    std::string token_file = "daypilot_token";
};

struct StoreConfig {
    std::string directory = "data";
    bool truncate_on_start = true;
};

struct LoggingConfig {
    std::string directory = "logs";
    std::string level = "info";
};

struct TelegramConfig {
    bool enabled = false;
    std::string bot_token;
    std::string chat_id;
};

// Every recognised option is listed here with its default. Unknown keys and
// out-of-range values are rejected with ConfigError.
class Config {
public:
    static Config& getInstance();

    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    std::string getApiKey() const { return api_key_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::StrategyConfig getStrategyConfig() const { return strategy_config_; }
    CalendarConfig getCalendarConfig() const { return calendar_config_; }
    DataSourceConfig getDataSourceConfig() const { return data_config_; }
    BrokerConfig getBrokerConfig() const { return broker_config_; }
    StoreConfig getStoreConfig() const { return store_config_; }
    LoggingConfig getLoggingConfig() const { return logging_config_; }
    TelegramConfig getTelegramConfig() const { return telegram_config_; }

private:
    Config() = default;

    std::string api_key_;

    engine::EngineConfig engine_config_;
    strategy::StrategyConfig strategy_config_;
    CalendarConfig calendar_config_;
    DataSourceConfig data_config_;
    BrokerConfig broker_config_;
    StoreConfig store_config_;
    LoggingConfig logging_config_;
    TelegramConfig telegram_config_;
};

} // namespace daypilot
