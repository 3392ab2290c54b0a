#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace clipboard_mcp::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string parse_backend(const std::string& value) {
  if (value == "auto" || value == "command" || value == "memory") {
    return value;
  }
  throw std::runtime_error("clipboard.backend must be one of auto, command, memory");
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "log_level") {
    config.log_level = parse_log_level(value);
    return;
  }

  if (key == "clipboard.backend") {
    config.clipboard.backend = parse_backend(value);
    return;
  }

  if (key == "clipboard.read_command") {
    config.clipboard.read_command = value;
    return;
  }

  if (key == "clipboard.write_command") {
    config.clipboard.write_command = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

const char* getenv_non_empty(const char* name) {
  const auto* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  // Two levels only: top-level keys, and indented keys under a "section:" header.
  std::string section;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (const auto comment_pos = line.find('#'); comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    const std::string stripped = trim(line);
    if (stripped.empty()) {
      continue;
    }

    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("malformed config line " + std::to_string(line_number) + ": " + stripped);
    }
    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    const bool indented = line.front() == ' ' || line.front() == '\t';
    if (!indented) {
      section = value.empty() ? key : std::string();
      if (!value.empty()) {
        apply_key_value(config, key, value);
      }
      continue;
    }

    if (section.empty()) {
      throw std::runtime_error("indented key outside a section on line " + std::to_string(line_number) + ": " + key);
    }
    apply_key_value(config, section + "." + key, value);
  }

  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const auto* level = getenv_non_empty("CLIPBOARD_MCP_LOG_LEVEL"); level != nullptr) {
    config.log_level = parse_log_level(level);
  } else if (const auto* legacy_level = getenv_non_empty("MCP_LOG_LEVEL"); legacy_level != nullptr) {
    config.log_level = parse_log_level(legacy_level);
  }

  if (const auto* backend = getenv_non_empty("CLIPBOARD_MCP_BACKEND"); backend != nullptr) {
    config.clipboard.backend = parse_backend(backend);
  }
  if (const auto* read_command = getenv_non_empty("CLIPBOARD_MCP_READ_COMMAND"); read_command != nullptr) {
    config.clipboard.read_command = read_command;
  }
  if (const auto* write_command = getenv_non_empty("CLIPBOARD_MCP_WRITE_COMMAND"); write_command != nullptr) {
    config.clipboard.write_command = write_command;
  }
}

std::string format_config_settings(const ServerConfig& config) {
  std::ostringstream output;
  output << "log_level=" << log_level_name(config.log_level) << " | clipboard.backend=" << config.clipboard.backend;
  if (!config.clipboard.read_command.empty()) {
    output << " | clipboard.read_command=" << config.clipboard.read_command;
  }
  if (!config.clipboard.write_command.empty()) {
    output << " | clipboard.write_command=" << config.clipboard.write_command;
  }
  return output.str();
}

}  // namespace clipboard_mcp::core
