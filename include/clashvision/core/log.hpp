#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace clashvision::core {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

enum class LogFormat {
  Pretty,
  Json,
};

/// Process-wide line logger. Warn/Error go to stderr, the rest to stdout.
/// init() reads CLASHVISION_LOG_FORMAT (pretty|json) and CLASHVISION_LOG_LEVEL
/// (debug|info|warn|error). Safe to call log() from multiple threads.
class Logger {
 public:
  static void init();

  static void set_level(LogLevel level);
  [[nodiscard]] static LogLevel level();
  static void set_format(LogFormat format);

  static void log(LogLevel level, std::string_view message, std::string_view target = {});

  [[nodiscard]] static std::string_view level_name(LogLevel level) noexcept;

 private:
  static std::string timestamp();
  static std::string escape_json(std::string_view s);

  static LogFormat format_;
  static LogLevel min_level_;
  static std::mutex mutex_;
};

}  // namespace clashvision::core

#define CLASHVISION_LOG_DEBUG(msg) ::clashvision::core::Logger::log(::clashvision::core::LogLevel::Debug, (msg))
#define CLASHVISION_LOG_INFO(msg) ::clashvision::core::Logger::log(::clashvision::core::LogLevel::Info, (msg))
#define CLASHVISION_LOG_WARN(msg) ::clashvision::core::Logger::log(::clashvision::core::LogLevel::Warn, (msg))
#define CLASHVISION_LOG_ERROR(msg) ::clashvision::core::Logger::log(::clashvision::core::LogLevel::Error, (msg))
