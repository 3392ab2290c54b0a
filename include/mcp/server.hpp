#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clipboard/clipboard.hpp"
#include "core/logger.hpp"
#include "mcp/errors.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/schema.hpp"
#include "mcp/session.hpp"
#include "mcp/tools.hpp"

namespace clipboard_mcp::mcp {

class Server {
 public:
  using StopPredicate = std::function<bool()>;

  Server(const SchemaRegistry& registry, clipboard::ClipboardPort& clipboard, const core::Logger& logger);

  // Reads one JSON-RPC message per line until EOF or until should_stop() reports true
  // between two lines. Every response line is flushed before the next read.
  int run(std::istream& in, std::ostream& out, const StopPredicate& should_stop);

  // Response line for one input line (no trailing newline), or nullopt when the line
  // only carried notifications.
  std::optional<std::string> handle_line(const std::string& line);

  [[nodiscard]] SessionState state() const noexcept { return session_.state(); }
  void shutdown() noexcept { session_.shutdown(); }

 private:
  std::optional<nlohmann::json> dispatch(const nlohmann::json& message);
  // nullopt for methods that are never answered.
  std::optional<nlohmann::json> route(const JsonRpcRequest& request, const nlohmann::json& id);
  Result<nlohmann::json> handle_tools_call(const nlohmann::json& params) const;

  const SchemaRegistry& registry_;
  const core::Logger& logger_;
  ToolExecutor executor_;
  Session session_{};
};

}  // namespace clipboard_mcp::mcp
