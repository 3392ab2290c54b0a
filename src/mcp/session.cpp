#include "mcp/session.hpp"

#include <string>

#include "mcp/jsonrpc.hpp"

namespace clipboard_mcp::mcp {

namespace {

Transition reject(const SessionState state, const ErrorKind kind, std::string details) {
  return Transition{.next = state, .route = Route::Rejected, .error = Error{.kind = kind, .details = std::move(details)}};
}

}  // namespace

const char* session_state_name(const SessionState state) noexcept {
  switch (state) {
    case SessionState::Uninitialized:
      return "uninitialized";
    case SessionState::Initialized:
      return "initialized";
    case SessionState::ShuttingDown:
      return "shutting_down";
  }
  return "unknown";
}

Transition advance(const SessionState current, const std::string_view method) {
  if (method == kKeepAliveMethod) {
    return Transition{.next = current, .route = Route::KeepAlive, .error = std::nullopt};
  }

  if (current == SessionState::ShuttingDown) {
    return reject(current, ErrorKind::ServerError, "server is shutting down");
  }

  if (method == "initialize") {
    return Transition{.next = SessionState::Initialized, .route = Route::Initialize, .error = std::nullopt};
  }

  if (method == "ping") {
    return Transition{.next = current, .route = Route::Ping, .error = std::nullopt};
  }

  if (method == "tools/list" || method == "tools/call") {
    if (current != SessionState::Initialized) {
      return reject(current, ErrorKind::InternalError, "server not initialized; call initialize first");
    }
    const auto route = method == "tools/list" ? Route::ToolsList : Route::ToolsCall;
    return Transition{.next = current, .route = route, .error = std::nullopt};
  }

  if (is_notification_method(method)) {
    return Transition{.next = current, .route = Route::Notification, .error = std::nullopt};
  }

  return reject(current, ErrorKind::MethodNotFound, "unknown method: " + std::string(method));
}

nlohmann::json initialize_result() {
  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
                        {"capabilities", {{"tools", nlohmann::json::object()}}}};
}

Transition Session::accept(const std::string_view method) {
  auto transition = advance(state_, method);
  state_ = transition.next;
  return transition;
}

}  // namespace clipboard_mcp::mcp
