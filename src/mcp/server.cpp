#include "mcp/server.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "mcp/validator.hpp"

namespace clipboard_mcp::mcp {

namespace {

constexpr const char* kTrailingWhitespace = " \t\r\n";

std::string serialize(const nlohmann::json& value) {
  // Clipboard contents are not guaranteed to be valid UTF-8.
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string describe_id(const nlohmann::json& id) { return serialize(id); }

}  // namespace

Server::Server(const SchemaRegistry& registry, clipboard::ClipboardPort& clipboard, const core::Logger& logger)
    : registry_(registry), logger_(logger), executor_(clipboard, logger) {}

int Server::run(std::istream& in, std::ostream& out, const StopPredicate& should_stop) {
  logger_.info("starting clipboard MCP server");

  std::string line;
  while (!should_stop() && std::getline(in, line)) {
    line.erase(line.find_last_not_of(kTrailingWhitespace) + 1);
    if (line.empty()) {
      continue;
    }

    logger_.debug("received " + std::to_string(line.size()) + " bytes");
    const auto response = handle_line(line);
    if (response.has_value()) {
      out << *response << '\n';
      out.flush();
    }
  }

  if (should_stop()) {
    logger_.info("shutdown signal received");
  } else {
    logger_.info("received EOF, shutting down");
  }
  session_.shutdown();
  logger_.info("clipboard MCP server shutdown complete");
  return 0;
}

std::optional<std::string> Server::handle_line(const std::string& line) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    logger_.error(std::string("parse error: ") + ex.what());
    return serialize(make_error_response(nullptr, Error{.kind = ErrorKind::ParseError, .details = ex.what()}));
  }

  if (message.is_array()) {
    if (message.empty()) {
      logger_.warning("rejecting empty batch");
      return serialize(make_error_response(
          nullptr, Error{.kind = ErrorKind::InvalidRequest, .details = "empty batch"}));
    }

    nlohmann::json responses = nlohmann::json::array();
    for (const auto& element : message) {
      if (auto response = dispatch(element); response.has_value()) {
        responses.push_back(std::move(*response));
      }
    }
    if (responses.empty()) {
      return std::nullopt;
    }
    return serialize(responses);
  }

  if (!message.is_object()) {
    logger_.error("parse error: top-level value is neither an object nor an array");
    return serialize(make_error_response(
        nullptr, Error{.kind = ErrorKind::ParseError, .details = "message must be a JSON object or array"}));
  }

  const auto response = dispatch(message);
  if (!response.has_value()) {
    return std::nullopt;
  }
  return serialize(*response);
}

std::optional<nlohmann::json> Server::dispatch(const nlohmann::json& message) {
  const auto parsed = parse_request(message);
  if (!parsed.ok()) {
    const auto id = recover_id(message);
    logger_.warning("invalid request (id=" + describe_id(id) + "): " + parsed.error().details);
    return make_error_response(id, parsed.error());
  }

  const auto& request = parsed.value();
  if (is_notification(request)) {
    logger_.debug("notification: " + request.method);
    return std::nullopt;
  }

  const nlohmann::json id = request.id.value_or(nullptr);
  logger_.debug("request method=" + request.method + " id=" + describe_id(id));

  try {
    return route(request, id);
  } catch (const std::exception& ex) {
    logger_.error("unexpected failure in " + request.method + ": " + ex.what());
    return make_error_response(id, Error{.kind = ErrorKind::InternalError, .details = ex.what()});
  }
}

std::optional<nlohmann::json> Server::route(const JsonRpcRequest& request, const nlohmann::json& id) {
  const auto transition = session_.accept(request.method);

  Result<nlohmann::json> outcome = Error{.kind = ErrorKind::InternalError, .details = "request was not routed"};
  switch (transition.route) {
    case Route::Initialize: {
      const auto& params = request.params;
      if (params.contains("clientInfo") || params.contains("protocolVersion")) {
        logger_.info("client info: " + serialize(params.value("clientInfo", nlohmann::json::object())) +
                     ", protocol version: " + serialize(params.value("protocolVersion", nlohmann::json("unknown"))));
      }
      outcome = initialize_result();
      break;
    }
    case Route::ToolsList:
      outcome = nlohmann::json{{"tools", registry_.to_json()}};
      break;
    case Route::ToolsCall:
      outcome = handle_tools_call(request.params);
      break;
    case Route::Ping:
      outcome = nlohmann::json::object();
      break;
    case Route::KeepAlive:
      logger_.debug("keep-alive " + request.method + " (id=" + describe_id(id) + ")");
      return std::nullopt;
    case Route::Notification:
      outcome = Error{.kind = ErrorKind::MethodNotFound, .details = "notification sent as request: " + request.method};
      break;
    case Route::Rejected:
      outcome = transition.error.value_or(Error{.kind = ErrorKind::InternalError, .details = "request rejected"});
      break;
  }

  if (!outcome.ok()) {
    const auto& error = outcome.error();
    logger_.warning(request.method + " failed (id=" + describe_id(id) + ", code=" +
                    std::to_string(error_code(error.kind)) + "): " + error.details);
    return make_error_response(id, error);
  }

  logger_.debug(request.method + " succeeded (id=" + describe_id(id) + ")");
  return make_result_response(id, outcome.value());
}

Result<nlohmann::json> Server::handle_tools_call(const nlohmann::json& params) const {
  const auto name_it = params.find("name");
  if (name_it == params.end()) {
    return invalid_params("missing 'name' parameter");
  }
  if (!name_it->is_string()) {
    return invalid_params("'name' parameter must be a string");
  }
  const auto& name = name_it->get_ref<const std::string&>();

  const auto args_it = params.find("arguments");
  const nlohmann::json arguments = args_it == params.end() ? nlohmann::json(nullptr) : *args_it;

  const auto validated = validate(registry_, name, arguments);
  if (!validated.ok()) {
    return validated.error();
  }

  const auto result = executor_.execute(validated.value());
  if (!result.ok()) {
    return result.error();
  }
  return result.value().to_json();
}

}  // namespace clipboard_mcp::mcp
