#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <stdexcept>

namespace clipboard_mcp::core {

LogLevel parse_log_level(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return LogLevel::Debug;
  }
  if (lower == "info") {
    return LogLevel::Info;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::Warning;
  }
  if (lower == "error") {
    return LogLevel::Error;
  }
  throw std::runtime_error("unknown log level: " + value);
}

const char* log_level_name(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

Logger::Logger(std::ostream& sink, const LogLevel threshold) noexcept : sink_(sink), threshold_(threshold) {}

bool Logger::enabled(const LogLevel level) const noexcept {
  return static_cast<int>(level) >= static_cast<int>(threshold_);
}

LogLevel Logger::threshold() const noexcept { return threshold_; }

void Logger::log(const LogLevel level, const std::string& message) const {
  if (!enabled(level)) {
    return;
  }
  sink_ << "[clipboard-mcp] " << log_level_name(level) << ' ' << message << '\n';
  sink_.flush();
}

void Logger::debug(const std::string& message) const { log(LogLevel::Debug, message); }

void Logger::info(const std::string& message) const { log(LogLevel::Info, message); }

void Logger::warning(const std::string& message) const { log(LogLevel::Warning, message); }

void Logger::error(const std::string& message) const { log(LogLevel::Error, message); }

}  // namespace clipboard_mcp::core
