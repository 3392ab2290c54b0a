#include "mcp/tools.hpp"

#include <exception>
#include <sstream>

namespace clipboard_mcp::mcp {

nlohmann::json ToolCallResult::to_json() const {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : content) {
    items.push_back({{"type", item.type}, {"text", item.text}});
  }
  return nlohmann::json{{"content", items}};
}

ToolExecutor::ToolExecutor(clipboard::ClipboardPort& clipboard, const core::Logger& logger)
    : clipboard_(clipboard), logger_(logger) {
  handlers_.emplace("get_clipboard", [this](const nlohmann::json& arguments) { return get_clipboard(arguments); });
  handlers_.emplace("set_clipboard", [this](const nlohmann::json& arguments) { return set_clipboard(arguments); });
}

Result<ToolCallResult> ToolExecutor::execute(const ValidatedArguments& arguments) const {
  if (arguments.tool == nullptr) {
    return Error{.kind = ErrorKind::InternalError, .details = "tool call was not validated"};
  }

  const auto handler_it = handlers_.find(arguments.tool->name);
  if (handler_it == handlers_.end()) {
    return Error{.kind = ErrorKind::InternalError, .details = "no handler for tool " + arguments.tool->name};
  }

  logger_.info("executing tool: " + arguments.tool->name);
  return handler_it->second(arguments.values);
}

Result<ToolCallResult> ToolExecutor::get_clipboard(const nlohmann::json& /*arguments*/) const {
  clipboard::ReadResult read;
  try {
    read = clipboard_.read();
  } catch (const std::exception& ex) {
    read = clipboard::ReadResult{.text = {}, .error = std::string(ex.what())};
  }
  if (read.error.has_value()) {
    logger_.error("clipboard read failed on " + clipboard::describe_platform() + ": " + *read.error);
    logger_.warning("returning empty string due to clipboard read failure");
    return ToolCallResult{.content = {ContentItem{.type = "text", .text = ""}}};
  }

  logger_.debug("retrieved clipboard content: " + std::to_string(code_point_length(read.text)) + " characters");
  return ToolCallResult{.content = {ContentItem{.type = "text", .text = std::move(read.text)}}};
}

Result<ToolCallResult> ToolExecutor::set_clipboard(const nlohmann::json& arguments) const {
  const auto& text = arguments.at("text").get_ref<const std::string&>();
  const auto length = code_point_length(text);

  clipboard::WriteResult written;
  try {
    written = clipboard_.write(text);
  } catch (const std::exception& ex) {
    written = clipboard::WriteResult{.ok = false, .error = std::string(ex.what())};
  }
  if (!written.ok) {
    const std::string diagnostic = written.error.value_or("unknown clipboard failure");
    const std::string platform = clipboard::describe_platform();
    logger_.error("clipboard write failed on " + platform + ": " + diagnostic);

    std::ostringstream details;
    details << "Failed to write to clipboard on " << platform << ": " << diagnostic
            << ". Solution: " << clipboard::platform_guidance(diagnostic);
    return Error{.kind = ErrorKind::ClipboardError, .details = details.str()};
  }

  logger_.debug("set clipboard content: " + std::to_string(length) + " characters");
  std::ostringstream message;
  message << "Successfully copied " << length << " characters to clipboard";
  return ToolCallResult{.content = {ContentItem{.type = "text", .text = message.str()}}};
}

}  // namespace clipboard_mcp::mcp
