#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "core/json_file.hpp"
#include "oauth/oauth_config.hpp"

namespace mcp_remote {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env(const char* name) {
  const char* value = std::getenv(name);
  if (value && *value) {
    return std::string(value);
  }
  return std::nullopt;
}

template <typename T>
std::optional<T> parse_number(const std::string& name, const std::string& text) {
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(text, &pos);
    if (pos != text.size() || value > std::numeric_limits<T>::max()) {
      throw std::out_of_range(text);
    }
    return static_cast<T>(value);
  } catch (const std::exception&) {
    spdlog::warn("[Config] Ignoring invalid {}: '{}'", name, text);
    return std::nullopt;
  }
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  auto doc = read_json_file(path);
  if (doc.failed()) {
    spdlog::warn("[Config] {} ({}), using defaults", doc.error->to_string(), path.string());
    return config;
  }
  if (!doc.value->has_value()) {
    return config;
  }

  const json& j = **doc.value;
  try {
    if (j.contains("auth_dir")) {
      config.auth_dir = j["auth_dir"].get<std::string>();
    }
    if (j.contains("client_id")) {
      config.client_id = j["client_id"].get<std::string>();
    }
    if (j.contains("client_secret")) {
      config.client_secret = j["client_secret"].get<std::string>();
    }
    config.callback_host = j.value("callback_host", "localhost");
    if (j.contains("callback_port")) {
      config.callback_port = j["callback_port"].get<uint16_t>();
    }
    config.auth_timeout_secs = j.value("auth_timeout_secs", uint64_t(300));
    if (j.contains("scope")) {
      config.scope = j["scope"].get<std::string>();
    }
    if (j.contains("auth_token")) {
      config.auth_token = j["auth_token"].get<std::string>();
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    spdlog::warn("[Config] Invalid config {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  return load(config_paths::default_config_file());
}

Config Config::from_env() {
  Config config = load_default();

  if (auto dir = env("MCP_REMOTE_AUTH_DIR")) {
    config.auth_dir = fs::path(*dir);
  }
  if (auto id = env("MCP_REMOTE_CLIENT_ID")) {
    config.client_id = *id;
  }
  if (auto secret = env("MCP_REMOTE_CLIENT_SECRET")) {
    config.client_secret = *secret;
  }
  if (auto host = env("MCP_REMOTE_CALLBACK_HOST")) {
    config.callback_host = *host;
  }
  if (auto port = env("MCP_REMOTE_CALLBACK_PORT")) {
    if (auto parsed = parse_number<uint16_t>("MCP_REMOTE_CALLBACK_PORT", *port)) {
      config.callback_port = *parsed;
    }
  }
  if (auto timeout = env("MCP_REMOTE_AUTH_TIMEOUT")) {
    if (auto parsed = parse_number<uint64_t>("MCP_REMOTE_AUTH_TIMEOUT", *timeout)) {
      config.auth_timeout_secs = *parsed;
    }
  }
  if (auto scope = env("MCP_REMOTE_SCOPE")) {
    config.scope = *scope;
  }
  if (auto level = env("MCP_REMOTE_LOG_LEVEL")) {
    config.log_level = *level;
  }

  return config;
}

Status Config::save(const fs::path& path) const {
  json j;

  if (auth_dir) {
    j["auth_dir"] = auth_dir->string();
  }
  if (client_id) {
    j["client_id"] = *client_id;
  }
  if (client_secret) {
    j["client_secret"] = *client_secret;
  }
  j["callback_host"] = callback_host;
  if (callback_port) {
    j["callback_port"] = *callback_port;
  }
  j["auth_timeout_secs"] = auth_timeout_secs;
  if (scope) {
    j["scope"] = *scope;
  }
  if (auth_token) {
    j["auth_token"] = *auth_token;
  }

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // May hold a client secret
  return write_json_file(path, j, true);
}

fs::path Config::resolved_auth_dir() const {
  return auth_dir ? *auth_dir : config_paths::auth_dir();
}

Result<oauth::OAuthConfig> Config::to_oauth_config(const std::string& server_url) const {
  oauth::OAuthConfigBuilder builder(server_url);
  builder.with_callback_host(callback_host).with_auth_timeout(auth_timeout_secs).with_auth_dir(resolved_auth_dir());

  if (client_id) {
    builder.with_static_client_info(oauth::StaticClientInfo{*client_id, client_secret});
  }
  if (callback_port) {
    builder.with_callback_port(*callback_port);
  }
  if (scope) {
    builder.with_scope(*scope);
  }

  return builder.build();
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path auth_dir() {
  return home_dir() / ".mcp-auth";
}

fs::path default_config_file() {
  return auth_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace mcp_remote
