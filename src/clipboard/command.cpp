#include "clipboard/clipboard.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace clipboard_mcp::clipboard {

namespace {

constexpr int kExecFailedStatus = 127;

struct ProcessOutcome {
  int exit_status{-1};
  std::string output{};
  std::string failure{};
};

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

std::string errno_message(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

bool write_all(const int fd, const std::string& data) noexcept {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

bool read_all(const int fd, std::string& out) noexcept {
  char chunk[4096]{};
  while (true) {
    const ssize_t bytes_read = ::read(fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      out.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read == 0) {
      return true;
    }
    if (errno == EINTR) {
      continue;
    }
    return false;
  }
}

int wait_for(const pid_t pid) noexcept {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

// Runs argv with `input` on stdin. Stdout is captured only when requested; helpers such
// as xclip leave a background child holding inherited descriptors, so writes never wait
// on stdout. Stderr always goes to /dev/null.
ProcessOutcome run_process(const std::vector<std::string>& argv, const std::string* input, const bool capture_output) {
  ProcessOutcome outcome;
  if (argv.empty()) {
    outcome.failure = "no clipboard command configured";
    return outcome;
  }

  int stdin_fds[2]{-1, -1};
  int stdout_fds[2]{-1, -1};
  if (pipe(stdin_fds) != 0) {
    outcome.failure = errno_message("pipe");
    return outcome;
  }
  if (capture_output && pipe(stdout_fds) != 0) {
    outcome.failure = errno_message("pipe");
    close_fd(stdin_fds[0]);
    close_fd(stdin_fds[1]);
    return outcome;
  }

  std::vector<char*> raw_argv;
  raw_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  raw_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    outcome.failure = errno_message("fork");
    close_fd(stdin_fds[0]);
    close_fd(stdin_fds[1]);
    close_fd(stdout_fds[0]);
    close_fd(stdout_fds[1]);
    return outcome;
  }

  if (pid == 0) {
    const int devnull = open("/dev/null", O_RDWR);
    dup2(stdin_fds[0], STDIN_FILENO);
    if (capture_output) {
      dup2(stdout_fds[1], STDOUT_FILENO);
    } else if (devnull >= 0) {
      dup2(devnull, STDOUT_FILENO);
    }
    if (devnull >= 0) {
      dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    close(stdin_fds[0]);
    close(stdin_fds[1]);
    if (capture_output) {
      close(stdout_fds[0]);
      close(stdout_fds[1]);
    }

    execvp(raw_argv[0], raw_argv.data());
    _exit(kExecFailedStatus);
  }

  close_fd(stdin_fds[0]);
  close_fd(stdout_fds[1]);

  // A helper that exits early closes its stdin; its exit status is the better diagnostic.
  std::string io_failure;
  if (input != nullptr && !write_all(stdin_fds[1], *input)) {
    io_failure = errno_message("write to clipboard helper");
  }
  close_fd(stdin_fds[1]);

  if (capture_output) {
    if (!read_all(stdout_fds[0], outcome.output) && io_failure.empty()) {
      io_failure = errno_message("read from clipboard helper");
    }
    close_fd(stdout_fds[0]);
  }

  outcome.exit_status = wait_for(pid);
  if (outcome.exit_status == kExecFailedStatus) {
    outcome.failure = "command not found: " + argv.front();
  } else if (outcome.exit_status != 0) {
    std::ostringstream failure;
    failure << argv.front() << " exited with status " << outcome.exit_status;
    outcome.failure = failure.str();
  } else if (!io_failure.empty()) {
    outcome.failure = io_failure;
  }
  return outcome;
}

}  // namespace

CommandClipboard::CommandClipboard(CommandSet commands) : commands_(std::move(commands)) {}

ReadResult CommandClipboard::read() {
  const auto outcome = run_process(commands_.read, nullptr, true);
  if (!outcome.failure.empty()) {
    return ReadResult{.text = {}, .error = outcome.failure};
  }
  return ReadResult{.text = outcome.output, .error = std::nullopt};
}

WriteResult CommandClipboard::write(const std::string& text) {
  const auto outcome = run_process(commands_.write, &text, false);
  if (!outcome.failure.empty()) {
    return WriteResult{.ok = false, .error = outcome.failure};
  }
  return WriteResult{.ok = true, .error = std::nullopt};
}

std::vector<std::string> split_command(const std::string& command_line) {
  std::vector<std::string> argv;
  std::istringstream input(command_line);
  std::string token;
  while (input >> token) {
    argv.push_back(token);
  }
  return argv;
}

}  // namespace clipboard_mcp::clipboard
