#include <clashvision/core/log.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace clashvision::core {

LogFormat Logger::format_ = LogFormat::Pretty;
LogLevel Logger::min_level_ = LogLevel::Info;
std::mutex Logger::mutex_;

namespace {

bool parse_level(std::string_view s, LogLevel& out) {
  if (s == "debug") out = LogLevel::Debug;
  else if (s == "info") out = LogLevel::Info;
  else if (s == "warn") out = LogLevel::Warn;
  else if (s == "error") out = LogLevel::Error;
  else return false;
  return true;
}

}  // namespace

void Logger::init() {
  std::lock_guard lock(mutex_);
  const char* fmt = std::getenv("CLASHVISION_LOG_FORMAT");
  format_ = (fmt && std::string_view(fmt) == "json") ? LogFormat::Json : LogFormat::Pretty;

  const char* lvl = std::getenv("CLASHVISION_LOG_LEVEL");
  LogLevel parsed = LogLevel::Info;
  if (lvl && parse_level(lvl, parsed)) {
    min_level_ = parsed;
  }
}

void Logger::set_level(LogLevel level) {
  std::lock_guard lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::level() {
  std::lock_guard lock(mutex_);
  return min_level_;
}

void Logger::set_format(LogFormat format) {
  std::lock_guard lock(mutex_);
  format_ = format;
}

std::string_view Logger::level_name(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

std::string Logger::timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  gmtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

std::string Logger::escape_json(std::string_view s) {
  std::ostringstream o;
  for (const char c : s) {
    switch (c) {
      case '"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

void Logger::log(LogLevel level, std::string_view message, std::string_view target) {
  std::lock_guard lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(min_level_)) return;

  std::ostream& stream =
      (level == LogLevel::Error || level == LogLevel::Warn) ? std::cerr : std::cout;

  if (format_ == LogFormat::Json) {
    stream << "{\"timestamp\":\"" << timestamp() << "\",\"level\":\""
           << level_name(level) << "\",\"message\":\"" << escape_json(message) << '"';
    if (!target.empty()) {
      stream << ",\"target\":\"" << escape_json(target) << '"';
    }
    stream << "}\n";
  } else {
    stream << timestamp() << ' ' << level_name(level) << ' ';
    if (!target.empty()) stream << '[' << target << "] ";
    stream << message << '\n';
  }
  stream.flush();
}

}  // namespace clashvision::core
