#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipboard_mcp::clipboard {

struct ReadResult {
  std::string text{};
  std::optional<std::string> error{};
};

struct WriteResult {
  bool ok{false};
  std::optional<std::string> error{};
};

// Narrow interface to the host clipboard. Calls block until the platform answers.
class ClipboardPort {
 public:
  virtual ~ClipboardPort() = default;

  virtual ReadResult read() = 0;
  virtual WriteResult write(const std::string& text) = 0;
};

class MemoryClipboard final : public ClipboardPort {
 public:
  ReadResult read() override;
  WriteResult write(const std::string& text) override;

  void fail_reads(std::optional<std::string> diagnostic) { read_failure_ = std::move(diagnostic); }
  void fail_writes(std::optional<std::string> diagnostic) { write_failure_ = std::move(diagnostic); }

  [[nodiscard]] const std::string& contents() const noexcept { return contents_; }
  [[nodiscard]] int write_calls() const noexcept { return write_calls_; }
  [[nodiscard]] int read_calls() const noexcept { return read_calls_; }

 private:
  std::string contents_{};
  std::optional<std::string> read_failure_{};
  std::optional<std::string> write_failure_{};
  int read_calls_{0};
  int write_calls_{0};
};

// argv vectors for the helper programs; argv[0] is looked up on PATH.
struct CommandSet {
  std::vector<std::string> read{};
  std::vector<std::string> write{};
};

class CommandClipboard final : public ClipboardPort {
 public:
  explicit CommandClipboard(CommandSet commands);

  ReadResult read() override;
  WriteResult write(const std::string& text) override;

  [[nodiscard]] const CommandSet& commands() const noexcept { return commands_; }

 private:
  CommandSet commands_;
};

// Reports a fixed diagnostic for every call; used when no helper can be found.
class UnavailableClipboard final : public ClipboardPort {
 public:
  explicit UnavailableClipboard(std::string diagnostic);

  ReadResult read() override;
  WriteResult write(const std::string& text) override;

 private:
  std::string diagnostic_;
};

std::string describe_platform();
std::string platform_guidance(const std::string& diagnostic);

// Helper commands for the current desktop session, or nullopt when none apply.
std::optional<CommandSet> detect_commands();

// Splits a command line on whitespace; quoting is not supported.
std::vector<std::string> split_command(const std::string& command_line);

}  // namespace clipboard_mcp::clipboard
