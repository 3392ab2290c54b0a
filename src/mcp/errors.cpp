#include "mcp/errors.hpp"

#include <stdexcept>

namespace clipboard_mcp::mcp {

const ErrorCodeEntry& lookup_error(const ErrorKind kind) {
  for (const auto& entry : kErrorCodeTable) {
    if (entry.kind == kind) {
      return entry;
    }
  }
  throw std::logic_error("error kind missing from code table");
}

int error_code(const ErrorKind kind) { return lookup_error(kind).code; }

const char* error_name(const ErrorKind kind) { return lookup_error(kind).message; }

Error invalid_params(std::string details) {
  return Error{.kind = ErrorKind::InvalidParams, .details = std::move(details)};
}

nlohmann::json to_wire(const Error& error) {
  const auto& entry = lookup_error(error.kind);

  std::string message = entry.message;
  if (!error.details.empty()) {
    message += ": ";
    message += error.details;
  }

  nlohmann::json wire{{"code", entry.code}, {"message", message}};
  if (!error.details.empty()) {
    wire["data"] = {{"details", error.details}};
  }
  return wire;
}

}  // namespace clipboard_mcp::mcp
