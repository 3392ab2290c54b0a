#include "clipboard/clipboard.hpp"

namespace clipboard_mcp::clipboard {

ReadResult MemoryClipboard::read() {
  ++read_calls_;
  if (read_failure_.has_value()) {
    return ReadResult{.text = {}, .error = read_failure_};
  }
  return ReadResult{.text = contents_, .error = std::nullopt};
}

WriteResult MemoryClipboard::write(const std::string& text) {
  ++write_calls_;
  if (write_failure_.has_value()) {
    return WriteResult{.ok = false, .error = write_failure_};
  }
  contents_ = text;
  return WriteResult{.ok = true, .error = std::nullopt};
}

UnavailableClipboard::UnavailableClipboard(std::string diagnostic) : diagnostic_(std::move(diagnostic)) {}

ReadResult UnavailableClipboard::read() { return ReadResult{.text = {}, .error = diagnostic_}; }

WriteResult UnavailableClipboard::write(const std::string& /*text*/) {
  return WriteResult{.ok = false, .error = diagnostic_};
}

}  // namespace clipboard_mcp::clipboard
