#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace harvestcast {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
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

    // One CSV line per served forecast: key,horizon,confidence,trend,first,last
    void logForecast(const std::string& key, int horizon_days, int confidence,
                     const std::string& trend, double first_estimate, double last_estimate);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> forecast_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) harvestcast::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) harvestcast::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) harvestcast::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) harvestcast::Logger::getInstance().error(__VA_ARGS__)

} // namespace harvestcast
