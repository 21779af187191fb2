#include "common/Logger.h"
#include "common/PathUtils.h"
#include <spdlog/async.h>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace daypilot {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level,
                        spdlog::sink_ptr alert_sink) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/daypilot.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        if (alert_sink) {
            alert_sink->set_level(spdlog::level::warn);
            alert_sink->set_pattern("%v");
            sinks.push_back(alert_sink);
        }

        if (alert_sink) {
            spdlog::init_thread_pool(8192, 1);
            main_logger_ = std::make_shared<spdlog::async_logger>(
                "main", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::block);
        } else {
            main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        }
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", logs_path.string() + "/trades.log");
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTrade(const std::string& symbol, const std::string& side,
                      double price, int quantity, double pnl) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << side << ","
            << std::fixed << std::setprecision(2) << price << ","
            << quantity << ","
            << std::fixed << std::setprecision(2) << pnl;
        trade_logger_->info(oss.str());
    }
}

void Logger::flush() {
    if (main_logger_) main_logger_->flush();
    if (trade_logger_) trade_logger_->flush();
}

void Logger::shutdown() {
    flush();
    main_logger_.reset();
    trade_logger_.reset();
    spdlog::shutdown();
    initialized_ = false;
}

} // namespace daypilot
