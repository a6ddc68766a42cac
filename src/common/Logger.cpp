#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace fvgscan {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
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
            logs_path.string() + "/fvgscan.log", 1024 * 1024 * 10, 3
        );
        
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
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

void Logger::logTrade(const std::string& symbol, const std::string& direction,
                      double entry_price, double close_price, double r_multiple,
                      const std::string& close_reason) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << direction << ","
            << std::fixed << std::setprecision(5) << entry_price << ","
            << std::fixed << std::setprecision(5) << close_price << ","
            << std::fixed << std::setprecision(2) << r_multiple << ","
            << close_reason;
        trade_logger_->info(oss.str());
    }
}

} // namespace fvgscan
