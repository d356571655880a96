#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace torrentflow::core {

// Values mirror spdlog::level::level_enum so they can be cast directly.
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();

    // Falls back to spdlog's default logger until initialize() is called.
    static std::shared_ptr<spdlog::logger> get() {
        return logger_ ? logger_ : spdlog::default_logger();
    }

    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::Info);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}

#define TORRENTFLOW_LOG(level, ...) \
    SPDLOG_LOGGER_CALL(::torrentflow::core::Logger::get(), level, __VA_ARGS__)

#define LOG_TRACE(...) TORRENTFLOW_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) TORRENTFLOW_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) TORRENTFLOW_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) TORRENTFLOW_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) TORRENTFLOW_LOG(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) TORRENTFLOW_LOG(spdlog::level::critical, __VA_ARGS__)
