#pragma once

#include <array>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace clipboard_mcp::mcp {

enum class ErrorKind {
  ParseError,
  InvalidRequest,
  MethodNotFound,
  InvalidParams,
  InternalError,
  ServerError,
  ClipboardError,
};

struct ErrorCodeEntry {
  ErrorKind kind;
  int code;
  const char* message;
};

// The only place an ErrorKind is turned into a wire code.
inline constexpr std::array<ErrorCodeEntry, 7> kErrorCodeTable{{
    {ErrorKind::ParseError, -32700, "Parse error"},
    {ErrorKind::InvalidRequest, -32600, "Invalid Request"},
    {ErrorKind::MethodNotFound, -32601, "Method not found"},
    {ErrorKind::InvalidParams, -32602, "Invalid params"},
    {ErrorKind::InternalError, -32603, "Internal error"},
    {ErrorKind::ServerError, -32000, "Server error"},
    {ErrorKind::ClipboardError, -32001, "Clipboard error"},
}};

const ErrorCodeEntry& lookup_error(ErrorKind kind);
int error_code(ErrorKind kind);
const char* error_name(ErrorKind kind);

struct Error {
  ErrorKind kind{ErrorKind::InternalError};
  std::string details{};
};

Error invalid_params(std::string details);

// {"code", "message", "data": {"details"}}; data is omitted when details are empty.
nlohmann::json to_wire(const Error& error);

template <typename T>
class Result {
 public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {}

  [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] const T& value() const& { return std::get<T>(state_); }
  [[nodiscard]] T&& value() && { return std::get<T>(std::move(state_)); }
  [[nodiscard]] const Error& error() const& { return std::get<Error>(state_); }

 private:
  std::variant<T, Error> state_;
};

}  // namespace clipboard_mcp::mcp
