#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/types.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// Cross-process lock timing
struct CoordinationOptions {
  std::chrono::seconds max_lock_age{30 * 60};
  std::chrono::milliseconds poll_interval{2000};
  std::chrono::seconds max_wait{300};
};

// Upper bound for the authorization wait
inline constexpr uint64_t kMaxAuthTimeoutSecs = 24 * 60 * 60;

// Validated, immutable configuration of one OAuthClient.
// Build through OAuthConfigBuilder.
struct OAuthConfig {
  std::string server_url;
  std::optional<ServerMetadata> server_metadata;
  std::optional<StaticClientInfo> static_client_info;
  std::optional<uint16_t> callback_port;
  std::string callback_host = "localhost";
  uint64_t auth_timeout_secs = 300;
  std::optional<std::string> scope;
  std::filesystem::path auth_dir;
  CoordinationOptions coordination;
};

class OAuthConfigBuilder {
 public:
  explicit OAuthConfigBuilder(std::string server_url);

  OAuthConfigBuilder& with_server_metadata(ServerMetadata metadata);
  OAuthConfigBuilder& with_static_client_info(StaticClientInfo info);
  OAuthConfigBuilder& with_callback_port(uint16_t port);
  OAuthConfigBuilder& with_callback_host(std::string host);
  OAuthConfigBuilder& with_auth_timeout(uint64_t seconds);
  OAuthConfigBuilder& with_scope(std::string scope);
  OAuthConfigBuilder& with_auth_dir(std::filesystem::path dir);
  OAuthConfigBuilder& with_coordination(CoordinationOptions options);

  // InvalidConfiguration on: empty or non-http(s) server URL, empty callback
  // host, zero timeout, empty static client id
  Result<OAuthConfig> build() const;

 private:
  OAuthConfig config_;
};

}  // namespace mcp_remote::oauth
