#include "auth/auth_provider.hpp"

#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "oauth/oauth_client.hpp"

namespace mcp_remote::auth {

BearerTokenAuthProvider::BearerTokenAuthProvider(std::string token) : token_(std::move(token)) {}

std::optional<std::string> BearerTokenAuthProvider::get_auth_header() {
  if (token_.empty()) {
    return std::nullopt;
  }
  return "Bearer " + token_;
}

OAuthAuthProvider::OAuthAuthProvider(std::shared_ptr<oauth::OAuthClient> client) : client_(std::move(client)) {}

std::optional<std::string> OAuthAuthProvider::get_auth_header() {
  auto token = client_->get_access_token();
  if (token.failed()) {
    // Do NOT fall back to an unauthenticated request
    spdlog::error("[Auth] OAuth provider failed to get token: {}", token.error->to_string());
    return std::nullopt;
  }
  return "Bearer " + *token.value;
}

AuthProviderPtr make_auth_provider(const Config& config, std::shared_ptr<oauth::OAuthClient> oauth_client) {
  if (config.auth_token && !config.auth_token->empty()) {
    spdlog::info("[Auth] Using static bearer token");
    return std::make_shared<BearerTokenAuthProvider>(*config.auth_token);
  }
  if (oauth_client) {
    spdlog::info("[Auth] Using OAuth for {}", oauth_client->server_url());
    return std::make_shared<OAuthAuthProvider>(std::move(oauth_client));
  }
  return nullptr;
}

}  // namespace mcp_remote::auth
