#include "clipboard/clipboard.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace clipboard_mcp::clipboard {

namespace {

bool has_env(const char* name) {
  const auto* value = std::getenv(name);
  return value != nullptr && value[0] != '\0';
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool is_wsl() {
  std::ifstream version("/proc/version");
  if (!version.is_open()) {
    return false;
  }
  std::stringstream buffer;
  buffer << version.rdbuf();
  const auto text = buffer.str();
  return text.find("Microsoft") != std::string::npos || text.find("microsoft") != std::string::npos ||
         text.find("WSL") != std::string::npos;
}

bool on_path(const std::string& program) {
  const auto* path = std::getenv("PATH");
  if (path == nullptr) {
    return false;
  }

  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const std::string candidate = dir + "/" + program;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string describe_platform() {
#if defined(__APPLE__)
  return "macOS";
#else
  if (is_wsl()) {
    return "WSL (Windows Subsystem for Linux)";
  }
  if (!has_env("DISPLAY") && !has_env("WAYLAND_DISPLAY")) {
    return "Linux (headless)";
  }
  return "Linux";
#endif
}

std::string platform_guidance(const std::string& diagnostic) {
  const auto platform = describe_platform();
  const auto message = lower(diagnostic);

  if (platform == "Linux (headless)") {
    return "Clipboard access requires a display server. On headless Linux systems, clipboard operations are not "
           "supported.";
  }
  if (platform == "Linux") {
    if (message.find("xclip") != std::string::npos || message.find("xsel") != std::string::npos ||
        message.find("wl-copy") != std::string::npos || message.find("wl-paste") != std::string::npos) {
      return "Missing clipboard utilities. Install xclip or xsel (X11) or wl-clipboard (Wayland).";
    }
    if (message.find("display") != std::string::npos) {
      return "No display available. Ensure the DISPLAY environment variable is set or run in a desktop "
             "environment.";
    }
    return "Check that a clipboard helper is installed and the desktop session is reachable.";
  }
  if (platform.rfind("WSL", 0) == 0) {
    return "WSL clipboard access may be limited. Use WSL2 with WSLg, or configure clip.exe and powershell.exe "
           "Get-Clipboard as the clipboard commands.";
  }
  if (platform == "macOS") {
    return "macOS clipboard access failed. Check privacy permissions and that the process is not sandboxed.";
  }
  return "Platform-specific guidance not available for " + platform;
}

std::optional<CommandSet> detect_commands() {
#if defined(__APPLE__)
  return CommandSet{.read = {"pbpaste"}, .write = {"pbcopy"}};
#else
  if (has_env("WAYLAND_DISPLAY") && on_path("wl-copy") && on_path("wl-paste")) {
    return CommandSet{.read = {"wl-paste", "--no-newline"}, .write = {"wl-copy"}};
  }
  if (has_env("DISPLAY")) {
    if (on_path("xclip")) {
      return CommandSet{.read = {"xclip", "-selection", "clipboard", "-o"},
                        .write = {"xclip", "-selection", "clipboard"}};
    }
    if (on_path("xsel")) {
      return CommandSet{.read = {"xsel", "--clipboard", "--output"}, .write = {"xsel", "--clipboard", "--input"}};
    }
  }
  return std::nullopt;
#endif
}

}  // namespace clipboard_mcp::clipboard
