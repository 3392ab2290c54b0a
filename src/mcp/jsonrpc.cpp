#include "mcp/jsonrpc.hpp"

namespace clipboard_mcp::mcp {

namespace {

Error invalid_request(std::string details) {
  return Error{.kind = ErrorKind::InvalidRequest, .details = std::move(details)};
}

}  // namespace

bool is_valid_id(const nlohmann::json& id) { return id.is_null() || id.is_string() || id.is_number(); }

nlohmann::json recover_id(const nlohmann::json& message) {
  if (!message.is_object()) {
    return nullptr;
  }
  const auto id_it = message.find("id");
  if (id_it == message.end() || !is_valid_id(*id_it)) {
    return nullptr;
  }
  return *id_it;
}

Result<JsonRpcRequest> parse_request(const nlohmann::json& message) {
  if (!message.is_object()) {
    return invalid_request("request must be a JSON object");
  }

  const auto jsonrpc_it = message.find("jsonrpc");
  if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    return invalid_request("jsonrpc must be \"2.0\"");
  }

  const auto method_it = message.find("method");
  if (method_it == message.end() || !method_it->is_string()) {
    return invalid_request("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto id_it = message.find("id");
  if (id_it != message.end()) {
    if (!is_valid_id(*id_it)) {
      return invalid_request("id must be a string, a number, or null");
    }
    parsed.id = *id_it;
  }

  const auto params_it = message.find("params");
  if (params_it != message.end()) {
    if (!params_it->is_object()) {
      return invalid_request("params must be an object");
    }
    parsed.params = *params_it;
  }

  return parsed;
}

bool is_notification_method(const std::string_view method) {
  return method.substr(0, kNotificationPrefix.size()) == kNotificationPrefix;
}

bool is_notification(const JsonRpcRequest& request) {
  return !request.id.has_value() && is_notification_method(request.method);
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const Error& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", to_wire(error)}};
}

}  // namespace clipboard_mcp::mcp
