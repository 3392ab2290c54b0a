#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcp/errors.hpp"

namespace clipboard_mcp::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "clipboard-mcp";
constexpr const char* kServerVersion = "1.0.0";

enum class SessionState {
  Uninitialized,
  Initialized,
  ShuttingDown,
};

const char* session_state_name(SessionState state) noexcept;

enum class Route {
  Initialize,
  ToolsList,
  ToolsCall,
  Ping,
  KeepAlive,
  Notification,
  Rejected,
};

struct Transition {
  SessionState next;
  Route route;
  // Set exactly when route is Rejected.
  std::optional<Error> error;
};

// Pure: the outcome depends only on the current state and the method name.
Transition advance(SessionState current, std::string_view method);

// Result object for "initialize"; identical on every call.
nlohmann::json initialize_result();

class Session {
 public:
  [[nodiscard]] SessionState state() const noexcept { return state_; }

  // Applies advance() to the held state.
  Transition accept(std::string_view method);

  // Terminal; request handling stops once this is set.
  void shutdown() noexcept { state_ = SessionState::ShuttingDown; }

 private:
  SessionState state_{SessionState::Uninitialized};
};

}  // namespace clipboard_mcp::mcp
