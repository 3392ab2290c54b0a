#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipboard/clipboard.hpp"
#include "core/logger.hpp"
#include "mcp/errors.hpp"
#include "mcp/validator.hpp"

namespace clipboard_mcp::mcp {

struct ContentItem {
  std::string type{"text"};
  std::string text{};
};

struct ToolCallResult {
  std::vector<ContentItem> content{};

  [[nodiscard]] nlohmann::json to_json() const;
};

class ToolExecutor {
 public:
  using Handler = std::function<Result<ToolCallResult>(const nlohmann::json&)>;

  ToolExecutor(clipboard::ClipboardPort& clipboard, const core::Logger& logger);

  ToolExecutor(const ToolExecutor&) = delete;
  ToolExecutor& operator=(const ToolExecutor&) = delete;

  Result<ToolCallResult> execute(const ValidatedArguments& arguments) const;

 private:
  Result<ToolCallResult> get_clipboard(const nlohmann::json& arguments) const;
  Result<ToolCallResult> set_clipboard(const nlohmann::json& arguments) const;

  clipboard::ClipboardPort& clipboard_;
  const core::Logger& logger_;
  std::unordered_map<std::string, Handler> handlers_;
};

}  // namespace clipboard_mcp::mcp
