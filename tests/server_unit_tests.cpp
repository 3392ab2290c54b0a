#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipboard/clipboard.hpp"
#include "core/logger.hpp"
#include "mcp/schema.hpp"
#include "mcp/server.hpp"
#include "mcp/session.hpp"

using clipboard_mcp::clipboard::ClipboardPort;
using clipboard_mcp::clipboard::MemoryClipboard;
using clipboard_mcp::clipboard::ReadResult;
using clipboard_mcp::clipboard::WriteResult;
using clipboard_mcp::core::LogLevel;
using clipboard_mcp::core::Logger;
using clipboard_mcp::mcp::PropertySchema;
using clipboard_mcp::mcp::PropertyType;
using clipboard_mcp::mcp::Route;
using clipboard_mcp::mcp::SchemaRegistry;
using clipboard_mcp::mcp::Server;
using clipboard_mcp::mcp::SessionState;
using clipboard_mcp::mcp::ToolDefinition;
using clipboard_mcp::mcp::ToolSchema;
using clipboard_mcp::mcp::advance;
using clipboard_mcp::mcp::clipboard_schema_registry;
using clipboard_mcp::mcp::kMaxClipboardTextLength;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class ThrowingClipboard final : public ClipboardPort {
 public:
  ReadResult read() override { throw std::runtime_error("platform read exploded"); }
  WriteResult write(const std::string& /*text*/) override { throw std::runtime_error("platform write exploded"); }
};

struct Fixture {
  std::ostringstream log{};
  Logger logger{log, LogLevel::Debug};
  MemoryClipboard clipboard{};
  Server server{clipboard_schema_registry(), clipboard, logger};

  nlohmann::json send(const nlohmann::json& message) {
    const auto line = server.handle_line(message.dump());
    if (!line.has_value()) {
      return nlohmann::json();
    }
    return nlohmann::json::parse(*line);
  }

  nlohmann::json send_raw(const std::string& text) {
    const auto line = server.handle_line(text);
    if (!line.has_value()) {
      return nlohmann::json();
    }
    return nlohmann::json::parse(*line);
  }

  nlohmann::json initialize(const nlohmann::json& id = 0) {
    return send({{"jsonrpc", "2.0"},
                 {"id", id},
                 {"method", "initialize"},
                 {"params", {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "test-client"}}}}}});
  }

  nlohmann::json call_tool(const nlohmann::json& id, const std::string& name, const nlohmann::json& arguments) {
    return send({{"jsonrpc", "2.0"},
                 {"id", id},
                 {"method", "tools/call"},
                 {"params", {{"name", name}, {"arguments", arguments}}}});
  }
};

int error_code_of(const nlohmann::json& response) {
  if (!response.is_object() || !response.contains("error")) {
    return 0;
  }
  return response.at("error").at("code").get<int>();
}

int test_session_transitions_are_pure() {
  const auto premature = advance(SessionState::Uninitialized, "tools/call");
  if (premature.route != Route::Rejected || premature.next != SessionState::Uninitialized ||
      !premature.error.has_value()) {
    return fail("test_session_transitions_are_pure", "tools/call before initialize must be rejected");
  }

  const auto init = advance(SessionState::Uninitialized, "initialize");
  const auto reinit = advance(SessionState::Initialized, "initialize");
  if (init.next != SessionState::Initialized || reinit.next != SessionState::Initialized ||
      init.route != Route::Initialize || reinit.route != Route::Initialize) {
    return fail("test_session_transitions_are_pure", "initialize must be accepted idempotently");
  }

  const auto listed = advance(SessionState::Initialized, "tools/list");
  if (listed.route != Route::ToolsList || listed.error.has_value()) {
    return fail("test_session_transitions_are_pure", "tools/list must route once initialized");
  }

  const auto closing = advance(SessionState::ShuttingDown, "initialize");
  if (closing.route != Route::Rejected || closing.next != SessionState::ShuttingDown) {
    return fail("test_session_transitions_are_pure", "shutting down is terminal");
  }

  const auto unknown = advance(SessionState::Initialized, "frobnicate");
  if (unknown.route != Route::Rejected || unknown.next != SessionState::Initialized) {
    return fail("test_session_transitions_are_pure", "unknown method must be rejected without a state change");
  }
  return 0;
}

int test_tools_before_initialize_are_rejected() {
  Fixture fixture;

  const auto call = fixture.call_tool(1, "get_clipboard", nlohmann::json::object());
  if (error_code_of(call) != -32603 || call.contains("result") || call.at("id") != 1) {
    return fail("test_tools_before_initialize_are_rejected", "tools/call before initialize must be -32603");
  }

  const auto list = fixture.send({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
  if (error_code_of(list) != -32603) {
    return fail("test_tools_before_initialize_are_rejected", "tools/list before initialize must be -32603");
  }

  if (fixture.server.state() != SessionState::Uninitialized) {
    return fail("test_tools_before_initialize_are_rejected", "rejected calls must not change state");
  }
  return 0;
}

int test_initialize_is_idempotent() {
  Fixture fixture;

  const auto first = fixture.initialize(1);
  const auto second = fixture.initialize("again");
  if (!first.contains("result") || !second.contains("result") || first.at("result") != second.at("result")) {
    return fail("test_initialize_is_idempotent", "repeated initialize must return the same result");
  }

  const auto& result = first.at("result");
  if (result.at("protocolVersion") != "2024-11-05" || result.at("serverInfo").at("name") != "clipboard-mcp" ||
      result.at("capabilities") != nlohmann::json{{"tools", nlohmann::json::object()}}) {
    return fail("test_initialize_is_idempotent", "initialize result fields mismatch");
  }
  if (second.at("id") != "again" || fixture.server.state() != SessionState::Initialized) {
    return fail("test_initialize_is_idempotent", "id echo or state mismatch");
  }

  const auto no_params = fixture.send({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "initialize"}});
  if (!no_params.contains("result")) {
    return fail("test_initialize_is_idempotent", "initialize without params must succeed");
  }
  return 0;
}

int test_ids_are_echoed_verbatim() {
  Fixture fixture;
  (void)fixture.initialize();

  const std::vector<nlohmann::json> ids{42, "abc-123", nullptr, 7.5, -1};
  for (const auto& id : ids) {
    const auto response = fixture.send({{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/list"}});
    if (response.at("id") != id || !response.contains("result")) {
      return fail("test_ids_are_echoed_verbatim", "response id must equal request id");
    }
  }
  return 0;
}

int test_tools_list_returns_registry() {
  Fixture fixture;
  (void)fixture.initialize();

  const auto response = fixture.send({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/list"}});
  const auto& tools = response.at("result").at("tools");
  if (tools != clipboard_schema_registry().to_json() || tools.size() != 2) {
    return fail("test_tools_list_returns_registry", "tools/list must return the registry");
  }
  return 0;
}

int test_clipboard_round_trip() {
  Fixture fixture;
  (void)fixture.initialize();

  const std::string text = "h\xC3\xA9llo \xF0\x9F\x8C\x8D";
  const auto set = fixture.call_tool(10, "set_clipboard", {{"text", text}});
  if (!set.contains("result") ||
      set.at("result").at("content").at(0).at("text") != "Successfully copied 7 characters to clipboard") {
    return fail("test_clipboard_round_trip", "set_clipboard should succeed");
  }

  const auto get = fixture.call_tool(11, "get_clipboard", nlohmann::json::object());
  const auto& content = get.at("result").at("content");
  if (content.size() != 1 || content.at(0).at("type") != "text" || content.at(0).at("text") != text) {
    return fail("test_clipboard_round_trip", "get_clipboard should return the same string");
  }

  const auto no_arguments = fixture.send(
      {{"jsonrpc", "2.0"}, {"id", 12}, {"method", "tools/call"}, {"params", {{"name", "get_clipboard"}}}});
  if (!no_arguments.contains("result")) {
    return fail("test_clipboard_round_trip", "get_clipboard without arguments should succeed");
  }
  return 0;
}

int test_size_limit_boundary() {
  Fixture fixture;
  (void)fixture.initialize();

  const auto at_limit = fixture.call_tool(1, "set_clipboard", {{"text", std::string(kMaxClipboardTextLength, 'x')}});
  if (!at_limit.contains("result")) {
    return fail("test_size_limit_boundary", "text of exactly the limit must succeed");
  }

  const auto over_limit =
      fixture.call_tool(2, "set_clipboard", {{"text", std::string(kMaxClipboardTextLength + 1, 'x')}});
  if (error_code_of(over_limit) != -32602 ||
      over_limit.at("error").at("message").get<std::string>().find("size limit") == std::string::npos) {
    return fail("test_size_limit_boundary", "text over the limit must be -32602 mentioning the size limit");
  }
  if (fixture.clipboard.contents().size() != kMaxClipboardTextLength) {
    return fail("test_size_limit_boundary", "rejected text must not reach the clipboard");
  }
  return 0;
}

int test_tools_call_validation_errors() {
  Fixture fixture;
  (void)fixture.initialize();

  if (error_code_of(fixture.call_tool(1, "set_clipboard", {{"text", "x"}, {"extra", 1}})) != -32602) {
    return fail("test_tools_call_validation_errors", "undeclared key must be -32602");
  }
  if (error_code_of(fixture.call_tool(2, "nonexistent", nlohmann::json::object())) != -32601) {
    return fail("test_tools_call_validation_errors", "unknown tool must be -32601");
  }
  if (error_code_of(fixture.call_tool(3, "set_clipboard", {{"text", 12}})) != -32602) {
    return fail("test_tools_call_validation_errors", "wrong type must be -32602");
  }

  const auto missing_name =
      fixture.send({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"}, {"params", nlohmann::json::object()}});
  if (error_code_of(missing_name) != -32602) {
    return fail("test_tools_call_validation_errors", "missing tool name must be -32602");
  }

  const auto error = fixture.call_tool(5, "set_clipboard", {{"text", "x"}, {"extra", 1}}).at("error");
  if (!error.contains("data") || !error.at("data").at("details").is_string()) {
    return fail("test_tools_call_validation_errors", "error data should carry details");
  }
  return 0;
}

int test_clipboard_failure_policies() {
  Fixture fixture;
  (void)fixture.initialize();

  fixture.clipboard.fail_reads("xclip exited with status 1");
  const auto get = fixture.call_tool(1, "get_clipboard", nlohmann::json::object());
  if (!get.contains("result") || get.at("result").at("content").at(0).at("text") != "") {
    return fail("test_clipboard_failure_policies", "read failure must yield an empty successful result");
  }

  fixture.clipboard.fail_writes("xclip exited with status 1");
  const auto set = fixture.call_tool(2, "set_clipboard", {{"text", "hello"}});
  if (error_code_of(set) != -32001 || set.at("id") != 2) {
    return fail("test_clipboard_failure_policies", "write failure must be -32001");
  }
  return 0;
}

int test_unknown_method_and_parse_errors() {
  Fixture fixture;

  const auto unknown = fixture.send({{"jsonrpc", "2.0"}, {"id", 9}, {"method", "frobnicate"}});
  if (error_code_of(unknown) != -32601 || unknown.at("id") != 9) {
    return fail("test_unknown_method_and_parse_errors", "unknown method must be -32601");
  }

  const auto garbage = fixture.send_raw("{not json");
  if (error_code_of(garbage) != -32700 || !garbage.at("id").is_null()) {
    return fail("test_unknown_method_and_parse_errors", "invalid JSON must be -32700 with null id");
  }

  const auto scalar = fixture.send_raw("42");
  if (error_code_of(scalar) != -32700 || !scalar.at("id").is_null()) {
    return fail("test_unknown_method_and_parse_errors", "non-object top level must be a parse error");
  }

  const auto bad_version = fixture.send({{"jsonrpc", "1.0"}, {"id", 3}, {"method", "initialize"}});
  if (error_code_of(bad_version) != -32600 || bad_version.at("id") != 3) {
    return fail("test_unknown_method_and_parse_errors", "wrong jsonrpc version must be -32600 with echoed id");
  }

  const auto ping = fixture.send({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "ping"}});
  if (!ping.contains("result") || ping.at("result") != nlohmann::json::object()) {
    return fail("test_unknown_method_and_parse_errors", "ping must answer with an empty object");
  }
  return 0;
}

int test_batches_preserve_order_and_isolate_failures() {
  Fixture fixture;

  const nlohmann::json batch = nlohmann::json::array({
      {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}},
      {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"},
       {"params", {{"name", "set_clipboard"}, {"arguments", {{"text", "batched"}}}}}},
      "not a request",
      {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "frobnicate"}},
      {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
       {"params", {{"name", "get_clipboard"}, {"arguments", nlohmann::json::object()}}}},
  });

  const auto responses = fixture.send(batch);
  if (!responses.is_array() || responses.size() != 5) {
    return fail("test_batches_preserve_order_and_isolate_failures", "batch must produce one response per request");
  }

  if (responses[0].at("id") != 1 || !responses[0].contains("result") || responses[1].at("id") != 2 ||
      !responses[1].contains("result") || !responses[2].at("id").is_null() || error_code_of(responses[2]) != -32600 ||
      responses[3].at("id") != 4 || error_code_of(responses[3]) != -32601 || responses[4].at("id") != 5) {
    return fail("test_batches_preserve_order_and_isolate_failures", "batch responses out of order or misclassified");
  }

  if (responses[4].at("result").at("content").at(0).at("text") != "batched") {
    return fail("test_batches_preserve_order_and_isolate_failures", "batch elements must run sequentially");
  }
  return 0;
}

int test_empty_batch_and_notifications() {
  Fixture fixture;

  const auto empty = fixture.send_raw("[]");
  if (!empty.is_object() || error_code_of(empty) != -32600 || !empty.at("id").is_null()) {
    return fail("test_empty_batch_and_notifications", "empty batch must yield a single -32600 response");
  }

  (void)fixture.initialize();
  const auto notification =
      fixture.server.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  if (notification.has_value()) {
    return fail("test_empty_batch_and_notifications", "notifications must not be answered");
  }

  const auto only_notifications = fixture.server.handle_line(
      R"([{"jsonrpc":"2.0","method":"notifications/initialized"},{"jsonrpc":"2.0","method":"notifications/cancelled"}])");
  if (only_notifications.has_value()) {
    return fail("test_empty_batch_and_notifications", "a batch of notifications writes nothing");
  }

  const auto null_id = fixture.send({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "frobnicate"}});
  if (error_code_of(null_id) != -32601 || !null_id.at("id").is_null()) {
    return fail("test_empty_batch_and_notifications", "null id requests still get a response");
  }
  return 0;
}

int test_invalid_utf8_from_clipboard_is_replaced() {
  Fixture fixture;
  (void)fixture.initialize();
  (void)fixture.clipboard.write(std::string("ok \xFF\xFE end"));

  const auto line = fixture.server.handle_line(
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_clipboard","arguments":{}}})");
  if (!line.has_value()) {
    return fail("test_invalid_utf8_from_clipboard_is_replaced", "response expected");
  }
  const auto response = nlohmann::json::parse(*line);
  const auto text = response.at("result").at("content").at(0).at("text").get<std::string>();
  if (text.rfind("ok ", 0) != 0 || text.find("\xEF\xBF\xBD") == std::string::npos) {
    return fail("test_invalid_utf8_from_clipboard_is_replaced", "invalid bytes should become U+FFFD");
  }
  return 0;
}

int test_run_loop_frames_lines() {
  Fixture fixture;
  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\r\n"
      "\n"
      "   \n"
      "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
      "[{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"},{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/list\"}]  \n"
      "{broken\n");
  std::ostringstream out;

  const int rc = fixture.server.run(in, out, [] { return false; });
  if (rc != 0) {
    return fail("test_run_loop_frames_lines", "run should return 0 on EOF");
  }

  std::vector<nlohmann::json> lines;
  std::istringstream written(out.str());
  std::string line;
  while (std::getline(written, line)) {
    lines.push_back(nlohmann::json::parse(line));
  }

  if (lines.size() != 3) {
    return fail("test_run_loop_frames_lines", "expected one output line per answered input line");
  }
  if (lines[0].at("id") != 1 || !lines[1].is_array() || lines[1].size() != 2 || lines[1][1].at("id") != 3 ||
      error_code_of(lines[2]) != -32700) {
    return fail("test_run_loop_frames_lines", "output lines mismatch");
  }
  if (out.str().back() != '\n') {
    return fail("test_run_loop_frames_lines", "every response line must end with a newline");
  }
  if (fixture.server.state() != SessionState::ShuttingDown) {
    return fail("test_run_loop_frames_lines", "EOF should move the session to shutting down");
  }

  const auto after = fixture.send({{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/list"}});
  if (error_code_of(after) != -32000) {
    return fail("test_run_loop_frames_lines", "requests after shutdown must be -32000");
  }
  return 0;
}

int test_run_loop_honours_stop_request() {
  Fixture fixture;
  std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
                        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
  std::ostringstream out;

  int checks = 0;
  // Allows the first line, then requests shutdown before the second read.
  (void)fixture.server.run(in, out, [&checks] { return ++checks > 1; });

  const auto text = out.str();
  if (text.find("\"id\":1") == std::string::npos || text.find("\"id\":2") != std::string::npos) {
    return fail("test_run_loop_honours_stop_request", "stop request must be honoured between lines");
  }
  if (fixture.server.state() != SessionState::ShuttingDown) {
    return fail("test_run_loop_honours_stop_request", "stop request should end in shutting down");
  }
  return 0;
}

int test_keep_alive_is_never_answered() {
  Fixture fixture;

  if (fixture.server.handle_line(R"({"jsonrpc":"2.0","method":"$/ping"})").has_value()) {
    return fail("test_keep_alive_is_never_answered", "$/ping without id must not be answered");
  }
  if (fixture.server.handle_line(R"({"jsonrpc":"2.0","id":5,"method":"$/ping"})").has_value()) {
    return fail("test_keep_alive_is_never_answered", "$/ping with id must not be answered");
  }
  if (fixture.server.state() != SessionState::Uninitialized) {
    return fail("test_keep_alive_is_never_answered", "$/ping must not change the session state");
  }

  (void)fixture.initialize();
  const auto batch = fixture.send_raw(
      R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","id":2,"method":"$/ping"},)"
      R"({"jsonrpc":"2.0","method":"$/ping"}])");
  if (!batch.is_array() || batch.size() != 1 || batch[0].at("id") != 1 || batch[0].at("result") != nlohmann::json::object()) {
    return fail("test_keep_alive_is_never_answered", "$/ping must take no slot in a batch");
  }

  const auto only_keep_alive = fixture.server.handle_line(
      R"([{"jsonrpc":"2.0","id":3,"method":"$/ping"},{"jsonrpc":"2.0","method":"$/ping"}])");
  if (only_keep_alive.has_value()) {
    return fail("test_keep_alive_is_never_answered", "a batch of $/ping writes nothing");
  }

  fixture.server.shutdown();
  if (fixture.server.handle_line(R"({"jsonrpc":"2.0","id":4,"method":"$/ping"})").has_value()) {
    return fail("test_keep_alive_is_never_answered", "$/ping stays silent while shutting down");
  }
  if (advance(SessionState::ShuttingDown, "$/ping").route != Route::KeepAlive) {
    return fail("test_keep_alive_is_never_answered", "$/ping routes to keep-alive in every state");
  }
  return 0;
}

int test_throwing_clipboard_follows_failure_policies() {
  std::ostringstream log;
  const Logger logger(log, LogLevel::Debug);
  ThrowingClipboard clipboard;
  Server server(clipboard_schema_registry(), clipboard, logger);
  (void)server.handle_line(R"({"jsonrpc":"2.0","id":0,"method":"initialize"})");

  const auto get_line = server.handle_line(
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"get_clipboard","arguments":{}}})");
  const auto get = nlohmann::json::parse(get_line.value_or("null"));
  if (!get.is_object() || !get.contains("result") || get.at("result").at("content").at(0).at("text") != "") {
    return fail("test_throwing_clipboard_follows_failure_policies", "a throwing read must yield empty text");
  }

  const auto set_line = server.handle_line(
      R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"set_clipboard","arguments":{"text":"x"}}})");
  const auto set = nlohmann::json::parse(set_line.value_or("null"));
  if (error_code_of(set) != -32001 || set.at("id") != 2 ||
      set.at("error").at("message").get<std::string>().find("platform write exploded") == std::string::npos) {
    return fail("test_throwing_clipboard_follows_failure_policies", "a throwing write must map to -32001");
  }
  return 0;
}

int test_unexpected_exception_is_internal_error() {
  // The handler reads "text" as a string while this schema admits an integer.
  std::vector<ToolDefinition> tools;
  tools.push_back(ToolDefinition{
      .name = "set_clipboard",
      .description = "mismatched schema",
      .input_schema = ToolSchema{.properties = {PropertySchema{
                                     .name = "text", .type = PropertyType::Integer, .required = true}}}});
  const SchemaRegistry registry(std::move(tools));

  std::ostringstream log;
  const Logger logger(log, LogLevel::Debug);
  MemoryClipboard clipboard;
  Server server(registry, clipboard, logger);
  (void)server.handle_line(R"({"jsonrpc":"2.0","id":0,"method":"initialize"})");

  const auto line = server.handle_line(
      R"({"jsonrpc":"2.0","id":"boom","method":"tools/call","params":{"name":"set_clipboard","arguments":{"text":7}}})");
  const auto response = nlohmann::json::parse(line.value_or("null"));
  if (error_code_of(response) != -32603 || response.at("id") != "boom") {
    return fail("test_unexpected_exception_is_internal_error", "escaped exception must map to -32603 with the id");
  }
  if (clipboard.write_calls() != 0) {
    return fail("test_unexpected_exception_is_internal_error", "clipboard must not be touched");
  }

  const auto ping = nlohmann::json::parse(
      server.handle_line(R"({"jsonrpc":"2.0","id":9,"method":"ping"})").value_or("null"));
  if (!ping.is_object() || ping.at("result") != nlohmann::json::object()) {
    return fail("test_unexpected_exception_is_internal_error", "server must keep serving after an exception");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_session_transitions_are_pure(); rc != 0) return rc;
  if (int rc = test_tools_before_initialize_are_rejected(); rc != 0) return rc;
  if (int rc = test_initialize_is_idempotent(); rc != 0) return rc;
  if (int rc = test_ids_are_echoed_verbatim(); rc != 0) return rc;
  if (int rc = test_tools_list_returns_registry(); rc != 0) return rc;
  if (int rc = test_clipboard_round_trip(); rc != 0) return rc;
  if (int rc = test_size_limit_boundary(); rc != 0) return rc;
  if (int rc = test_tools_call_validation_errors(); rc != 0) return rc;
  if (int rc = test_clipboard_failure_policies(); rc != 0) return rc;
  if (int rc = test_unknown_method_and_parse_errors(); rc != 0) return rc;
  if (int rc = test_batches_preserve_order_and_isolate_failures(); rc != 0) return rc;
  if (int rc = test_empty_batch_and_notifications(); rc != 0) return rc;
  if (int rc = test_invalid_utf8_from_clipboard_is_replaced(); rc != 0) return rc;
  if (int rc = test_run_loop_frames_lines(); rc != 0) return rc;
  if (int rc = test_run_loop_honours_stop_request(); rc != 0) return rc;
  if (int rc = test_keep_alive_is_never_answered(); rc != 0) return rc;
  if (int rc = test_throwing_clipboard_follows_failure_policies(); rc != 0) return rc;
  if (int rc = test_unexpected_exception_is_internal_error(); rc != 0) return rc;

  std::cout << "[PASS] server unit tests\n";
  return 0;
}
