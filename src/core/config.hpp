#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "types.hpp"

namespace mcp_remote {

namespace oauth {
struct OAuthConfig;
}

// Application configuration (~/.mcp-auth/config.json)
struct Config {
  // Token/lock/log storage directory (default: ~/.mcp-auth)
  std::optional<std::filesystem::path> auth_dir;

  // Pre-registered client; skips dynamic registration when set
  std::optional<std::string> client_id;
  std::optional<std::string> client_secret;

  // Local callback listener
  std::string callback_host = "localhost";
  std::optional<uint16_t> callback_port;

  // Seconds to wait for the user to finish in the browser
  uint64_t auth_timeout_secs = 300;

  std::optional<std::string> scope;

  // Static bearer token, used instead of OAuth when set
  std::optional<std::string> auth_token;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file. Missing file gives defaults; a malformed file is logged
  // and also gives defaults.
  static Config load(const std::filesystem::path& path);

  // Load the global config file
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: MCP_REMOTE_AUTH_DIR, MCP_REMOTE_CLIENT_ID, MCP_REMOTE_CLIENT_SECRET,
  //        MCP_REMOTE_CALLBACK_HOST, MCP_REMOTE_CALLBACK_PORT,
  //        MCP_REMOTE_AUTH_TIMEOUT, MCP_REMOTE_SCOPE, MCP_REMOTE_LOG_LEVEL
  static Config from_env();

  // Save to file
  Status save(const std::filesystem::path& path) const;

  std::filesystem::path resolved_auth_dir() const;

  // Validated OAuth configuration for one server
  Result<oauth::OAuthConfig> to_oauth_config(const std::string& server_url) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

// ~/.mcp-auth
std::filesystem::path auth_dir();

std::filesystem::path default_config_file();
}  // namespace config_paths

}  // namespace mcp_remote
