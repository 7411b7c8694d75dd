#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "net/http_client.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// Token endpoint calls and token file persistence.
//
// Token files live in auth_dir, one per server URL:
//   https://example.com/mcp -> https_example.com_mcp.json
class TokenManager {
 public:
  static constexpr std::chrono::seconds kExpiryBuffer{60};

  TokenManager(net::HttpRequester& http, std::filesystem::path auth_dir);

  // authorization_code grant. The new token is persisted before returning.
  Result<StoredToken> exchange_code_for_token(const ServerMetadata& metadata, const std::string& client_id,
                                              const std::optional<std::string>& client_secret, const std::string& code,
                                              const std::string& redirect_uri, const std::string& code_verifier, const std::string& server_url);

  // refresh_token grant. The refreshed token is persisted before returning.
  Result<StoredToken> refresh_token(const ServerMetadata& metadata, const std::string& client_id, const std::optional<std::string>& client_secret,
                                    const StoredToken& stored);

  // nullopt when no file exists for this server
  Result<std::optional<StoredToken>> load_token(const std::string& server_url) const;

  Status save_token(const StoredToken& token) const;

  Status delete_token(const std::string& server_url) const;

  // true when now + buffer >= expires_at; tokens without expiry never expire
  static bool is_token_expired(const StoredToken& token, std::chrono::seconds buffer = std::chrono::seconds(0));

  // Stored token, refreshed first when it expires within kExpiryBuffer.
  // TokenStorage error when nothing is stored.
  Result<std::string> get_valid_token(const ServerMetadata& metadata, const std::string& client_id,
                                      const std::optional<std::string>& client_secret, const std::string& server_url);

  std::filesystem::path token_path(const std::string& server_url) const;

  static std::string token_file_name(const std::string& server_url);

  const std::filesystem::path& auth_dir() const {
    return auth_dir_;
  }

 private:
  Result<TokenResponse> post_token_request(const std::string& endpoint, const std::map<std::string, std::string>& params, ErrorKind failure_kind);

  net::HttpRequester& http_;
  std::filesystem::path auth_dir_;
};

}  // namespace mcp_remote::oauth
