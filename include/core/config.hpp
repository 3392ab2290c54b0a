#pragma once

#include <string>

#include "core/logger.hpp"

namespace clipboard_mcp::core {

struct ClipboardConfig {
  // auto, command, or memory.
  std::string backend{"auto"};
  std::string read_command{};
  std::string write_command{};
};

struct ServerConfig {
  LogLevel log_level{LogLevel::Info};
  ClipboardConfig clipboard{};
};

ServerConfig load_server_config(const std::string& path);

// CLIPBOARD_MCP_LOG_LEVEL (or MCP_LOG_LEVEL), CLIPBOARD_MCP_BACKEND,
// CLIPBOARD_MCP_READ_COMMAND, CLIPBOARD_MCP_WRITE_COMMAND.
void apply_env_overrides(ServerConfig& config);

std::string format_config_settings(const ServerConfig& config);

}  // namespace clipboard_mcp::core
