#pragma once

/// @file logging.h
/// @brief SupportPulse logging utilities wrapping spdlog

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace supportpulse {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "supportpulse";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "supportpulse.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"); unknown names map to kInfo
LogLevel ParseLogLevel(std::string_view name);

/// @brief Initialize the global logger. Only the first call takes effect.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger, initializing it with defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

#define SUPPORTPULSE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::supportpulse::GetLogger(), __VA_ARGS__)
#define SUPPORTPULSE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::supportpulse::GetLogger(), __VA_ARGS__)
#define SUPPORTPULSE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::supportpulse::GetLogger(), __VA_ARGS__)
#define SUPPORTPULSE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::supportpulse::GetLogger(), __VA_ARGS__)
#define SUPPORTPULSE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::supportpulse::GetLogger(), __VA_ARGS__)
#define SUPPORTPULSE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::supportpulse::GetLogger(), __VA_ARGS__)

}  // namespace supportpulse
