#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace trendlab {

class Logger {
public:
    static Logger& getInstance();

    // Console output goes to stderr; stdout is reserved for the JSON response.
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

    // One CSV line per realized position change: symbol,date,from,to,price,reason
    void logTransition(const std::string& symbol, const std::string& date,
                       const std::string& from, const std::string& to,
                       double price, const std::string& reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> transition_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) trendlab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) trendlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) trendlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) trendlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace trendlab
