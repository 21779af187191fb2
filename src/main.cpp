#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TelegramSink.h"
#include "core/state/TradeStoreJsonl.h"
#include "data/FileMarketData.h"
#include "data/KiteMarketData.h"
#include "data/SimulatorMarketData.h"
#include "engine/TradingEngine.h"
#include "execution/KiteBrokerGateway.h"
#include "execution/PaperBroker.h"
#include "network/HttpClient.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace daypilot;

// Global engine instance for Ctrl+C shutdown
engine::TradingEngine* g_engine = nullptr;

void signalHandler(int signal) {
    if (signal == SIGINT && g_engine) {
        g_engine->stop();
    }
}

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " --config <path> [--mode live|paper]\n";
}

static network::KiteCredentials kiteCredentials(const BrokerConfig& cfg, const std::string& api_key) {
    network::KiteCredentials credentials;
    credentials.api_key = api_key;
    credentials.token_file = cfg.token_file;
    return credentials;
}

static std::unique_ptr<data::IMarketDataSource> makeMarketData(const DataSourceConfig& cfg,
                                                               const BrokerConfig& broker_cfg,
                                                               const std::string& api_key,
                                                               const MarketClock& clock) {
    if (cfg.source == "kite") {
        LOG_INFO("Market data: Kite historical API at {}", broker_cfg.base_url);
        return std::make_unique<data::KiteMarketData>(
            std::make_shared<network::HttpClient>(broker_cfg.base_url),
            kiteCredentials(broker_cfg, api_key), broker_cfg.exchange, clock);
    }
    if (cfg.source == "file") {
        LOG_INFO("Market data: replay file {}", cfg.replay_file);
        return std::make_unique<data::FileMarketData>(cfg.replay_file, clock);
    }
    LOG_INFO("Market data: simulator at {}", cfg.simulator_url);
    return std::make_unique<data::SimulatorMarketData>(
        std::make_shared<network::HttpClient>(cfg.simulator_url), clock);
}

static std::unique_ptr<execution::IBrokerGateway> makeBroker(const engine::EngineConfig& engine_cfg,
                                                             const BrokerConfig& cfg,
                                                             const std::string& api_key) {
    if (engine_cfg.mode == engine::TradingMode::PAPER) {
        LOG_INFO("Paper trading: margin {:.2f}", engine_cfg.fallback_margin);
        return std::make_unique<execution::PaperBroker>(engine_cfg.fallback_margin);
    }

    execution::KiteSettings settings;
    settings.credentials = kiteCredentials(cfg, api_key);
    settings.exchange = cfg.exchange;
    settings.product = cfg.product;
    LOG_INFO("Live trading via {}", cfg.base_url);
    return std::make_unique<execution::KiteBrokerGateway>(
        std::make_shared<network::HttpClient>(cfg.base_url), settings);
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string mode_override;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            mode_override = argv[++i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty() || (!mode_override.empty() && mode_override != "live" && mode_override != "paper")) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);

        const auto logging = config.getLoggingConfig();
        const auto telegram = config.getTelegramConfig();
        spdlog::sink_ptr alert_sink;
        if (telegram.enabled) {
            alert_sink = TelegramSink::create(telegram.bot_token, telegram.chat_id);
        }
        Logger::getInstance().initialize(logging.directory, logging.level, alert_sink);

        LOG_INFO("=============================================");
        LOG_INFO("       DayPilot intraday engine");
        LOG_INFO("=============================================");

        auto engine_cfg = config.getEngineConfig();
        if (mode_override == "live") {
            engine_cfg.mode = engine::TradingMode::LIVE;
        } else if (mode_override == "paper") {
            engine_cfg.mode = engine::TradingMode::PAPER;
        }

        const auto calendar_cfg = config.getCalendarConfig();
        const MarketClock clock(calendar_cfg.utc_offset_minutes);
        const auto store_cfg = config.getStoreConfig();

        auto market_data = makeMarketData(config.getDataSourceConfig(), config.getBrokerConfig(),
                                          config.getApiKey(), clock);
        auto broker = makeBroker(engine_cfg, config.getBrokerConfig(), config.getApiKey());
        core::TradeStoreJsonl store(store_cfg.directory, clock, store_cfg.truncate_on_start);

        engine::TradingEngine engine(engine_cfg, config.getStrategyConfig(), calendar_cfg,
                                     *market_data, *broker, store);
        g_engine = &engine;
        std::signal(SIGINT, signalHandler);

        engine.run();

        g_engine = nullptr;
        LOG_INFO("DayPilot stopped");
        Logger::getInstance().shutdown();
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        Logger::getInstance().shutdown();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_ERROR("Fatal error: {}", e.what());
        Logger::getInstance().shutdown();
        return 1;
    }
}
