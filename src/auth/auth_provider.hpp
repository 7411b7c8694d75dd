#pragma once

#include <memory>
#include <optional>
#include <string>

namespace mcp_remote {
struct Config;
}

namespace mcp_remote::oauth {
class OAuthClient;
}

namespace mcp_remote::auth {

// Supplies the Authorization header for requests to the remote MCP server.
// The transport layer only sees this interface.
class AuthProvider {
 public:
  virtual ~AuthProvider() = default;

  // Authentication scheme identifier (e.g., "bearer", "oauth")
  virtual std::string scheme() const = 0;

  // Get valid authorization header value (e.g., "Bearer xxx")
  // Returns nullopt if authentication failed or unavailable
  virtual std::optional<std::string> get_auth_header() = 0;
};

using AuthProviderPtr = std::shared_ptr<AuthProvider>;

// Static token given on the command line or in the config file
class BearerTokenAuthProvider : public AuthProvider {
 public:
  explicit BearerTokenAuthProvider(std::string token);

  std::string scheme() const override {
    return "bearer";
  }

  std::optional<std::string> get_auth_header() override;

 private:
  std::string token_;
};

// Token from the OAuth flow, obtained (or refreshed) on every call
class OAuthAuthProvider : public AuthProvider {
 public:
  explicit OAuthAuthProvider(std::shared_ptr<oauth::OAuthClient> client);

  std::string scheme() const override {
    return "oauth";
  }

  std::optional<std::string> get_auth_header() override;

 private:
  std::shared_ptr<oauth::OAuthClient> client_;
};

// Static token wins over OAuth. nullptr when neither is available.
AuthProviderPtr make_auth_provider(const Config& config, std::shared_ptr<oauth::OAuthClient> oauth_client = nullptr);

}  // namespace mcp_remote::auth
