#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace daypilot {

class Logger {
public:
    static Logger& getInstance();

    // alert_sink (optional) receives WARN and above, e.g. the Telegram sink.
    // With an alert sink the main logger is asynchronous so slow deliveries
    // never block the caller.
    void initialize(const std::string& log_dir = "logs",
                    const std::string& level = "info",
                    spdlog::sink_ptr alert_sink = nullptr);
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV row per entry/exit in trades.log
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, int quantity, double pnl);

    void flush();

    // Drains queued messages and joins the async worker
    void shutdown();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) daypilot::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) daypilot::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) daypilot::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) daypilot::Logger::getInstance().error(__VA_ARGS__)

} // namespace daypilot
