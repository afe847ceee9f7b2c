#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace patternedge {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    // 실행 파일 기준 로그 경로
    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);
    if (ec) {
        throw std::runtime_error("Cannot create log directory " + logs_path.string() + ": " + ec.message());
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/patternedge.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", logs_path.string() + "/trades.log");
        trade_logger_->set_pattern("%Y-%m-%d,%v");
        trade_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTrade(const std::string& trade_id, const std::string& instrument,
                      const std::string& direction, const std::string& horizon_label,
                      const std::string& exit_reason, double entry_price,
                      double exit_price, double return_pct, double pnl) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << trade_id << "," << instrument << "," << direction << ","
            << horizon_label << "," << exit_reason << ","
            << std::fixed << std::setprecision(4) << entry_price << ","
            << std::fixed << std::setprecision(4) << exit_price << ","
            << std::fixed << std::setprecision(2) << return_pct << ","
            << std::fixed << std::setprecision(2) << pnl;
        trade_logger_->info(oss.str());
    }
}

} // namespace patternedge
