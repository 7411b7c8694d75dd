// mcp-remote-auth: run the OAuth flow for a remote MCP server and manage the
// stored token. Diagnostics go to stderr; only --print-token writes stdout.

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "mcp_remote/mcp_remote.hpp"

using namespace mcp_remote;

namespace {

void print_usage(const char* prog) {
  std::cerr << "mcp-remote-auth " << MCP_REMOTE_VERSION_STRING << "\n\n"
            << "Usage: " << prog << " <server_url> [options]\n\n"
            << "Options:\n"
            << "  --client-id ID        Pre-registered OAuth client id\n"
            << "  --client-secret S     Client secret for --client-id\n"
            << "  --scope S             Requested scope\n"
            << "  --port N              Preferred callback port\n"
            << "  --host H              Callback host (default: localhost)\n"
            << "  --timeout SECS        Authorization timeout (default: 300)\n"
            << "  --auth-dir DIR        Token and lock file directory (default: ~/.mcp-auth)\n"
            << "  --log-level L         trace|debug|info|warn|error (default: info)\n"
            << "  --clear               Delete the stored token and exit\n"
            << "  --status              Report whether a token is stored and exit\n"
            << "  --print-token         Write the access token to stdout\n"
            << "  -h, --help            Show this help\n";
}

struct Options {
  std::string server_url;
  bool clear = false;
  bool status = false;
  bool print_token = false;
};

// Returns false on a usage error
bool parse_args(int argc, char* argv[], Options& options, Config& config) {
  auto number = [](const std::string& flag, const std::string& text, uint64_t max, uint64_t& out) {
    try {
      size_t pos = 0;
      out = std::stoull(text, &pos);
      if (pos == text.size() && out <= max) return true;
    } catch (const std::exception&) {
    }
    std::cerr << "Invalid value for " << flag << ": " << text << "\n";
    return false;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string& out) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "-h" || arg == "--help") {
      return false;
    } else if (arg == "--clear") {
      options.clear = true;
    } else if (arg == "--status") {
      options.status = true;
    } else if (arg == "--print-token") {
      options.print_token = true;
    } else if (arg == "--client-id") {
      if (!next(value)) return false;
      config.client_id = value;
    } else if (arg == "--client-secret") {
      if (!next(value)) return false;
      config.client_secret = value;
    } else if (arg == "--scope") {
      if (!next(value)) return false;
      config.scope = value;
    } else if (arg == "--host") {
      if (!next(value)) return false;
      config.callback_host = value;
    } else if (arg == "--auth-dir") {
      if (!next(value)) return false;
      config.auth_dir = value;
    } else if (arg == "--log-level") {
      if (!next(value)) return false;
      config.log_level = value;
    } else if (arg == "--port") {
      uint64_t port = 0;
      if (!next(value) || !number(arg, value, 65535, port)) return false;
      config.callback_port = static_cast<uint16_t>(port);
    } else if (arg == "--timeout") {
      uint64_t secs = 0;
      if (!next(value) || !number(arg, value, UINT32_MAX, secs)) return false;
      config.auth_timeout_secs = secs;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    } else if (options.server_url.empty()) {
      options.server_url = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return false;
    }
  }

  if (options.server_url.empty()) {
    std::cerr << "Missing <server_url>\n";
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  // ----- Configuration -----
  Config config = Config::from_env();
  Options options;
  if (!parse_args(argc, argv, options, config)) {
    print_usage(argv[0]);
    return 2;
  }

  init_log(config.log_file ? config.log_file->string() : "", config.log_level);
  spdlog::cfg::load_env_levels();

  auto oauth_config = config.to_oauth_config(options.server_url);
  if (oauth_config.failed()) {
    std::cerr << "Error: " << oauth_config.error->to_string() << "\n";
    return 1;
  }

  // ----- IO thread -----
  asio::io_context io_ctx;
  auto client = oauth::OAuthClient::create(io_ctx, *oauth_config.value);

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&client](const asio::error_code& ec, int) {
    if (!ec) client->cancel();
  });

  std::thread io_thread([&io_ctx]() {
    auto work = asio::make_work_guard(io_ctx);
    io_ctx.run();
  });

  auto shutdown = [&]() {
    io_ctx.stop();
    if (io_thread.joinable()) io_thread.join();
  };

  int exit_code = 0;
  if (options.clear) {
    auto status = client->clear_tokens();
    if (status.failed()) {
      std::cerr << "Error: " << status.error->to_string() << "\n";
      exit_code = 1;
    } else {
      std::cerr << "Cleared stored token for " << client->server_url() << "\n";
    }
  } else if (options.status) {
    bool stored = client->has_stored_token();
    std::cerr << client->server_url() << ": " << (stored ? "token stored" : "no stored token") << "\n";
    exit_code = stored ? 0 : 1;
  } else {
    client->set_state_callback([](oauth::AuthState state) {
      spdlog::debug("[CLI] {}", oauth::to_string(state));
    });

    auto token = client->get_access_token();
    if (token.failed()) {
      std::cerr << "Authorization failed: " << token.error->to_string() << "\n";
      exit_code = 1;
    } else {
      std::cerr << "Authorized for " << client->server_url() << "\n";
      if (options.print_token) {
        std::cout << *token.value << std::endl;
      }
    }
  }

  shutdown();
  return exit_code;
}
