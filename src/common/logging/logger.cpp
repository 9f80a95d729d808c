#include "common/logging/logger.h"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rtmp::logging {

namespace {
constexpr const char* kLoggerName = "rtmp";

std::mutex g_config_mutex;

std::shared_ptr<spdlog::logger> make_default_logger() {
  auto created = std::make_shared<spdlog::logger>(
      kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  created->set_level(spdlog::level::info);
  return created;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}
}  // namespace

void configure_logging(LogLevel level, bool console, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  std::string file_error;
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  const auto& configured = logger();
  {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    configured->sinks() = std::move(sinks);
    configured->set_level(to_spdlog(level));
    configured->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    configured->flush_on(spdlog::level::warn);
  }
  if (!file_error.empty()) {
    configured->warn("Cannot open log file {}: {}", log_file, file_error);
  }
}

const std::shared_ptr<spdlog::logger>& logger() {
  static const std::shared_ptr<spdlog::logger> instance = make_default_logger();
  return instance;
}

}  // namespace rtmp::logging
