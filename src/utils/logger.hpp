#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace orion {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& name);
std::string to_string(LogLevel level);

class Logger {
public:
    // An empty log_file_path logs to the console only.
    static void initialize(const std::string& log_file_path = "",
                           LogLevel level = LogLevel::INFO,
                           bool console_output = true,
                           std::size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           std::size_t max_files = 3);

    static void shutdown();

    template<typename Arg, typename... Args>
    static void trace(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    template<typename Arg, typename... Args>
    static void debug(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    template<typename Arg, typename... Args>
    static void info(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    template<typename Arg, typename... Args>
    static void warn(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    template<typename Arg, typename... Args>
    static void error(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    template<typename Arg, typename... Args>
    static void critical(fmt::format_string<Arg, Args...> fmt, Arg&& arg, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ORION_LOG_TRACE(...) orion::utils::Logger::trace(__VA_ARGS__)
#define ORION_LOG_DEBUG(...) orion::utils::Logger::debug(__VA_ARGS__)
#define ORION_LOG_INFO(...) orion::utils::Logger::info(__VA_ARGS__)
#define ORION_LOG_WARN(...) orion::utils::Logger::warn(__VA_ARGS__)
#define ORION_LOG_ERROR(...) orion::utils::Logger::error(__VA_ARGS__)
#define ORION_LOG_CRITICAL(...) orion::utils::Logger::critical(__VA_ARGS__)

#define ORION_SCOPED_TIMER(name) orion::utils::ScopedTimer orion_scoped_timer(name)

} // namespace utils
} // namespace orion
