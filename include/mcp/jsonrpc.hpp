#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mcp/errors.hpp"

namespace clipboard_mcp::mcp {

constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr std::string_view kNotificationPrefix = "notifications/";
// Keep-alive probe sent by some clients. It is never answered, with or without an id.
inline constexpr std::string_view kKeepAliveMethod = "$/ping";

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  // Unset when the message carries no "id" member at all; a present null is kept.
  std::optional<nlohmann::json> id;
};

bool is_valid_id(const nlohmann::json& id);

// Best-effort id recovery for error responses to messages that fail validation.
nlohmann::json recover_id(const nlohmann::json& message);

Result<JsonRpcRequest> parse_request(const nlohmann::json& message);

bool is_notification_method(std::string_view method);

// A message without an id whose method is in the notifications/ namespace.
bool is_notification(const JsonRpcRequest& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const Error& error);

}  // namespace clipboard_mcp::mcp
