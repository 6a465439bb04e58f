#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace tradebots {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    // Relative directories live next to the executable
    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(log_dir);

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [t%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "tradebots.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
        trade_logger_->set_pattern("%v");
        trade_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTransaction(const Transaction& tx) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << tx.timestamp_ms << ","
            << tx.user << ","
            << toString(tx.kind) << ","
            << tx.base_asset << "/" << tx.quote_asset << ","
            << toString(tx.side) << ","
            << std::fixed << std::setprecision(8) << tx.quantity << ","
            << std::fixed << std::setprecision(2) << tx.price << ","
            << tx.executed_by_bot.value_or("manual");
        trade_logger_->info(oss.str());
    }
}

void Logger::shutdown() {
    if (main_logger_) {
        main_logger_->flush();
    }
    if (trade_logger_) {
        trade_logger_->flush();
    }
}

} // namespace tradebots
