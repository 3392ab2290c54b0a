#pragma once

#include <memory>

#include "clipboard/clipboard.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

namespace clipboard_mcp::clipboard {

// Throws std::runtime_error when backend "command" lacks a read or write command.
std::unique_ptr<ClipboardPort> make_clipboard(const core::ClipboardConfig& config, const core::Logger& logger);

}  // namespace clipboard_mcp::clipboard
