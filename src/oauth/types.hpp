#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "oauth/pkce.hpp"

namespace mcp_remote::oauth {

// RFC 8414 authorization server metadata.
// Members this struct does not model are kept in `extra` and written back.
struct ServerMetadata {
  std::string issuer;
  std::string authorization_endpoint;
  std::string token_endpoint;
  std::optional<std::string> registration_endpoint;
  std::optional<std::string> jwks_uri;
  std::optional<std::vector<std::string>> response_types_supported;
  std::optional<std::vector<std::string>> grant_types_supported;
  std::optional<std::vector<std::string>> token_endpoint_auth_methods_supported;
  std::optional<std::vector<std::string>> scopes_supported;
  std::optional<std::vector<std::string>> code_challenge_methods_supported;
  json extra = json::object();

  json to_json() const;
  // Json error when issuer/authorization_endpoint/token_endpoint are missing
  static Result<ServerMetadata> from_json(const json& j);
};

// Pre-registered client credentials
struct StaticClientInfo {
  std::string client_id;
  std::optional<std::string> client_secret;
};

using ClientCredentials = StaticClientInfo;

// RFC 7591 registration response
struct ClientRegistrationResponse {
  std::string client_id;
  std::optional<std::string> client_secret;
  std::optional<int64_t> client_id_issued_at;
  std::optional<int64_t> client_secret_expires_at;
  std::vector<std::string> redirect_uris;
  std::optional<std::string> token_endpoint_auth_method;
  std::optional<std::string> registration_access_token;
  std::optional<std::string> registration_client_uri;
  json extra = json::object();

  ClientCredentials credentials() const {
    return ClientCredentials{client_id, client_secret};
  }

  static Result<ClientRegistrationResponse> from_json(const json& j);
};

// Token endpoint response (authorization_code or refresh_token grant)
struct TokenResponse {
  std::string access_token;
  std::string token_type = "Bearer";
  std::optional<int64_t> expires_in;
  std::optional<std::string> refresh_token;
  std::optional<std::string> scope;

  static Result<TokenResponse> from_json(const json& j);
};

// Persisted token, one file per server URL
struct StoredToken {
  std::string access_token;
  std::string token_type = "Bearer";
  std::optional<std::string> refresh_token;
  std::optional<std::string> scope;
  std::optional<Timestamp> expires_at;  // nullopt: never expires
  std::string server_url;
  Timestamp created_at;
  Timestamp updated_at;

  // Build a fresh token from a token endpoint response
  static StoredToken from_response(const TokenResponse& response, const std::string& server_url);

  // Apply a refresh response. Omitted refresh_token/scope keep previous values;
  // created_at is preserved.
  StoredToken refreshed(const TokenResponse& response) const;

  json to_json() const;
  static Result<StoredToken> from_json(const json& j);
};

// Advisory lock file contents
struct LockfileRecord {
  uint32_t pid = 0;
  uint16_t port = 0;
  Timestamp timestamp;
  std::string server_url_hash;

  json to_json() const;
  static Result<LockfileRecord> from_json(const json& j);
};

// What the callback listener hands back
struct AuthorizationResponse {
  std::string code;
  std::string state;
};

// In-memory state of one authorization attempt
struct AuthorizationSession {
  std::string state;
  PkceChallenge pkce;
  std::string redirect_uri;
  Timestamp expiry;
};

}  // namespace mcp_remote::oauth
