#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rtmp::logging {

enum class LogLevel { trace, debug, info, warn, error, off };

// Configure the process-wide logger by replacing its sinks and level.
// console: attach a colored stderr sink.
// log_file: when non-empty, also append to this file.
// Call before other threads start logging.
void configure_logging(LogLevel level, bool console, const std::string& log_file = "");

// Returns the process-wide logger. It is created once, writing to stderr at
// info level, and keeps its identity across configure_logging() calls.
const std::shared_ptr<spdlog::logger>& logger();

}  // namespace rtmp::logging

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::rtmp::logging::logger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::rtmp::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::rtmp::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::rtmp::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::rtmp::logging::logger(), __VA_ARGS__)
