/**
 * @file logging.hpp
 * @brief spdlog-backed logger shared by the orchestration core
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace acmeflow {
namespace logging {

enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5,
  OFF = 6
};

/**
 * @brief Parse a level name ("trace" ... "off")
 * @return The level, or std::nullopt for an unknown name
 */
constexpr std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
  if (name == "trace") return LogLevel::TRACE;
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  if (name == "critical") return LogLevel::CRITICAL;
  if (name == "off") return LogLevel::OFF;
  return std::nullopt;
}

}  // namespace logging
}  // namespace acmeflow

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace acmeflow {
namespace logging {

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    if (logger_) {
      logger_->set_level(toSpdlog(level));
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  void setLogLevel(const std::string& level_str) {
    setLevel(parseLogLevel(level_str).value_or(LogLevel::INFO));
  }

 private:
  Logger() {
    logger_ = spdlog::get("acmeflow");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("acmeflow");
    }
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) noexcept {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        break;
    }
    return spdlog::level::off;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace acmeflow

#define ACMEFLOW_LOG_TRACE(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define ACMEFLOW_LOG_DEBUG(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define ACMEFLOW_LOG_INFO(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define ACMEFLOW_LOG_WARN(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define ACMEFLOW_LOG_ERROR(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define ACMEFLOW_LOG_CRITICAL(...) \
  acmeflow::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define ACMEFLOW_LOG_TRACE(...)
#define ACMEFLOW_LOG_DEBUG(...)
#define ACMEFLOW_LOG_INFO(...)
#define ACMEFLOW_LOG_WARN(...)
#define ACMEFLOW_LOG_ERROR(...)
#define ACMEFLOW_LOG_CRITICAL(...)

namespace acmeflow {
namespace logging {
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  void setLogLevel(const std::string&) {}
};
}  // namespace logging
}  // namespace acmeflow

#endif
