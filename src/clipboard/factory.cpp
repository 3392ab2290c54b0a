#include "clipboard/factory.hpp"

#include <stdexcept>
#include <string>

namespace clipboard_mcp::clipboard {

namespace {

std::string join(const std::vector<std::string>& argv) {
  std::string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += arg;
  }
  return joined;
}

}  // namespace

std::unique_ptr<ClipboardPort> make_clipboard(const core::ClipboardConfig& config, const core::Logger& logger) {
  if (config.backend == "memory") {
    logger.info("using in-memory clipboard; contents are not shared with the desktop");
    return std::make_unique<MemoryClipboard>();
  }

  CommandSet commands{.read = split_command(config.read_command), .write = split_command(config.write_command)};

  if (config.backend == "command") {
    if (commands.read.empty() || commands.write.empty()) {
      throw std::runtime_error("clipboard.backend command requires clipboard.read_command and clipboard.write_command");
    }
  } else if (commands.read.empty() || commands.write.empty()) {
    const auto detected = detect_commands();
    if (!detected.has_value()) {
      const std::string diagnostic = "no clipboard helper available on " + describe_platform();
      logger.warning(diagnostic + "; reads return empty text and writes fail");
      return std::make_unique<UnavailableClipboard>(diagnostic);
    }
    if (commands.read.empty()) {
      commands.read = detected->read;
    }
    if (commands.write.empty()) {
      commands.write = detected->write;
    }
  }

  logger.info("clipboard commands: read='" + join(commands.read) + "' write='" + join(commands.write) + "'");
  return std::make_unique<CommandClipboard>(std::move(commands));
}

}  // namespace clipboard_mcp::clipboard
