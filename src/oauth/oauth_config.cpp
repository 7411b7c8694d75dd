#include "oauth/oauth_config.hpp"

#include "core/config.hpp"
#include "net/url.hpp"

namespace mcp_remote::oauth {

OAuthConfigBuilder::OAuthConfigBuilder(std::string server_url) {
  config_.server_url = std::move(server_url);
  config_.auth_dir = config_paths::auth_dir();
}

OAuthConfigBuilder& OAuthConfigBuilder::with_server_metadata(ServerMetadata metadata) {
  config_.server_metadata = std::move(metadata);
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_static_client_info(StaticClientInfo info) {
  config_.static_client_info = std::move(info);
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_callback_port(uint16_t port) {
  config_.callback_port = port;
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_callback_host(std::string host) {
  config_.callback_host = std::move(host);
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_auth_timeout(uint64_t seconds) {
  config_.auth_timeout_secs = seconds;
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_scope(std::string scope) {
  config_.scope = std::move(scope);
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_auth_dir(std::filesystem::path dir) {
  config_.auth_dir = std::move(dir);
  return *this;
}

OAuthConfigBuilder& OAuthConfigBuilder::with_coordination(CoordinationOptions options) {
  config_.coordination = options;
  return *this;
}

Result<OAuthConfig> OAuthConfigBuilder::build() const {
  auto invalid = [](const std::string& message) {
    return Result<OAuthConfig>::failure(ErrorKind::InvalidConfiguration, message);
  };

  const auto& url = config_.server_url;
  if (url.empty()) {
    return invalid("server URL is empty");
  }
  if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
    return invalid("server URL must start with http:// or https://: " + url);
  }
  if (net::trim_trailing_slashes(url.substr(url.find("://") + 3)).empty()) {
    return invalid("server URL has no host: " + url);
  }
  if (config_.callback_host.empty()) {
    return invalid("callback host is empty");
  }
  if (config_.auth_timeout_secs == 0) {
    return invalid("auth timeout must be greater than zero");
  }
  if (config_.auth_timeout_secs > kMaxAuthTimeoutSecs) {
    return invalid("auth timeout exceeds " + std::to_string(kMaxAuthTimeoutSecs) + " seconds");
  }
  if (config_.static_client_info && config_.static_client_info->client_id.empty()) {
    return invalid("static client id is empty");
  }
  if (config_.auth_dir.empty()) {
    return invalid("auth directory is empty");
  }

  return Result<OAuthConfig>::success(config_);
}

}  // namespace mcp_remote::oauth
