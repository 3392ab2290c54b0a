#include <signal.h>

#include <csignal>
#include <iostream>
#include <string>

#include "clipboard/factory.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "mcp/schema.hpp"
#include "mcp/server.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// No SA_RESTART: a read blocked on stdin must return so the loop can see the flag.
void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  std::signal(SIGPIPE, SIG_IGN);
}

}  // namespace

int main(int argc, char** argv) {
  install_signal_handlers();

  clipboard_mcp::core::ServerConfig config{};
  try {
    if (argc > 1) {
      config = clipboard_mcp::core::load_server_config(argv[1]);
    }
    clipboard_mcp::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  const clipboard_mcp::core::Logger logger(std::cerr, config.log_level);
  logger.info("loaded config" + (argc > 1 ? " from " + std::string(argv[1]) : std::string()) + " | " +
              clipboard_mcp::core::format_config_settings(config));

  try {
    auto clipboard = clipboard_mcp::clipboard::make_clipboard(config.clipboard, logger);
    clipboard_mcp::mcp::Server server(clipboard_mcp::mcp::clipboard_schema_registry(), *clipboard, logger);
    return server.run(std::cin, std::cout, [] { return g_shutdown_requested != 0; });
  } catch (const std::exception& ex) {
    logger.error(std::string("fatal error: ") + ex.what());
    return 1;
  }
}
