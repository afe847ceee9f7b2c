#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace patternedge {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

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

    // One CSV line per closed trade in the daily trades.log:
    // trade_id,instrument,direction,horizon,exit_reason,entry,exit,return_pct,pnl
    void logTrade(const std::string& trade_id, const std::string& instrument,
                  const std::string& direction, const std::string& horizon_label,
                  const std::string& exit_reason, double entry_price,
                  double exit_price, double return_pct, double pnl);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) patternedge::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) patternedge::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) patternedge::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) patternedge::Logger::getInstance().error(__VA_ARGS__)

} // namespace patternedge
