#pragma once

#include <iosfwd>
#include <string>

namespace clipboard_mcp::core {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
};

// Accepts debug, info, warning (or warn), error in any case. Throws std::runtime_error.
LogLevel parse_log_level(const std::string& value);
const char* log_level_name(LogLevel level) noexcept;

// Line-oriented diagnostics; the sink must never be the protocol stream.
class Logger {
 public:
  Logger(std::ostream& sink, LogLevel threshold) noexcept;

  [[nodiscard]] bool enabled(LogLevel level) const noexcept;
  [[nodiscard]] LogLevel threshold() const noexcept;

  void log(LogLevel level, const std::string& message) const;
  void debug(const std::string& message) const;
  void info(const std::string& message) const;
  void warning(const std::string& message) const;
  void error(const std::string& message) const;

 private:
  std::ostream& sink_;
  LogLevel threshold_;
};

}  // namespace clipboard_mcp::core
