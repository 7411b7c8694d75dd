#include "oauth/types.hpp"

#include <limits>

#include "core/clock.hpp"

namespace mcp_remote::oauth {

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

std::optional<int64_t> optional_int(const json& j, const char* key) {
  if (j.contains(key) && j[key].is_number_integer()) {
    return j[key].get<int64_t>();
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> optional_list(const json& j, const char* key) {
  if (j.contains(key) && j[key].is_array()) {
    return j[key].get<std::vector<std::string>>();
  }
  return std::nullopt;
}

std::optional<std::string> required_string(const json& j, const char* key) {
  auto value = optional_string(j, key);
  if (value && value->empty()) {
    return std::nullopt;
  }
  return value;
}

// Everything in `j` except the listed members
json collect_extra(const json& j, std::initializer_list<const char*> known) {
  json extra = json::object();
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool is_known = false;
    for (const char* key : known) {
      if (it.key() == key) {
        is_known = true;
        break;
      }
    }
    if (!is_known) {
      extra[it.key()] = it.value();
    }
  }
  return extra;
}

}  // namespace

// ============================================================
// ServerMetadata
// ============================================================

json ServerMetadata::to_json() const {
  json j = extra.is_object() ? extra : json::object();
  j["issuer"] = issuer;
  j["authorization_endpoint"] = authorization_endpoint;
  j["token_endpoint"] = token_endpoint;
  if (registration_endpoint) j["registration_endpoint"] = *registration_endpoint;
  if (jwks_uri) j["jwks_uri"] = *jwks_uri;
  if (response_types_supported) j["response_types_supported"] = *response_types_supported;
  if (grant_types_supported) j["grant_types_supported"] = *grant_types_supported;
  if (token_endpoint_auth_methods_supported) j["token_endpoint_auth_methods_supported"] = *token_endpoint_auth_methods_supported;
  if (scopes_supported) j["scopes_supported"] = *scopes_supported;
  if (code_challenge_methods_supported) j["code_challenge_methods_supported"] = *code_challenge_methods_supported;
  return j;
}

Result<ServerMetadata> ServerMetadata::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<ServerMetadata>::failure(ErrorKind::Json, "server metadata is not a JSON object");
  }

  try {
    ServerMetadata metadata;
    auto issuer = required_string(j, "issuer");
    auto authorization_endpoint = required_string(j, "authorization_endpoint");
    auto token_endpoint = required_string(j, "token_endpoint");
    if (!issuer || !authorization_endpoint || !token_endpoint) {
      return Result<ServerMetadata>::failure(ErrorKind::Json, "server metadata missing issuer, authorization_endpoint or token_endpoint");
    }

    metadata.issuer = *issuer;
    metadata.authorization_endpoint = *authorization_endpoint;
    metadata.token_endpoint = *token_endpoint;
    metadata.registration_endpoint = optional_string(j, "registration_endpoint");
    metadata.jwks_uri = optional_string(j, "jwks_uri");
    metadata.response_types_supported = optional_list(j, "response_types_supported");
    metadata.grant_types_supported = optional_list(j, "grant_types_supported");
    metadata.token_endpoint_auth_methods_supported = optional_list(j, "token_endpoint_auth_methods_supported");
    metadata.scopes_supported = optional_list(j, "scopes_supported");
    metadata.code_challenge_methods_supported = optional_list(j, "code_challenge_methods_supported");
    metadata.extra = collect_extra(j, {"issuer", "authorization_endpoint", "token_endpoint", "registration_endpoint", "jwks_uri",
                                       "response_types_supported", "grant_types_supported", "token_endpoint_auth_methods_supported",
                                       "scopes_supported", "code_challenge_methods_supported"});
    return Result<ServerMetadata>::success(std::move(metadata));
  } catch (const json::exception& e) {
    return Result<ServerMetadata>::failure(ErrorKind::Json, std::string("invalid server metadata: ") + e.what());
  }
}

// ============================================================
// ClientRegistrationResponse
// ============================================================

Result<ClientRegistrationResponse> ClientRegistrationResponse::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<ClientRegistrationResponse>::failure(ErrorKind::Json, "registration response is not a JSON object");
  }

  try {
    auto client_id = required_string(j, "client_id");
    if (!client_id) {
      return Result<ClientRegistrationResponse>::failure(ErrorKind::Json, "registration response missing client_id");
    }

    ClientRegistrationResponse response;
    response.client_id = *client_id;
    response.client_secret = optional_string(j, "client_secret");
    response.client_id_issued_at = optional_int(j, "client_id_issued_at");
    response.client_secret_expires_at = optional_int(j, "client_secret_expires_at");
    response.redirect_uris = optional_list(j, "redirect_uris").value_or(std::vector<std::string>{});
    response.token_endpoint_auth_method = optional_string(j, "token_endpoint_auth_method");
    response.registration_access_token = optional_string(j, "registration_access_token");
    response.registration_client_uri = optional_string(j, "registration_client_uri");
    response.extra = collect_extra(j, {"client_id", "client_secret", "client_id_issued_at", "client_secret_expires_at", "redirect_uris",
                                       "token_endpoint_auth_method", "registration_access_token", "registration_client_uri"});
    return Result<ClientRegistrationResponse>::success(std::move(response));
  } catch (const json::exception& e) {
    return Result<ClientRegistrationResponse>::failure(ErrorKind::Json, std::string("invalid registration response: ") + e.what());
  }
}

// ============================================================
// TokenResponse
// ============================================================

Result<TokenResponse> TokenResponse::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<TokenResponse>::failure(ErrorKind::Json, "token response is not a JSON object");
  }

  auto access_token = required_string(j, "access_token");
  if (!access_token) {
    return Result<TokenResponse>::failure(ErrorKind::Json, "token response missing access_token");
  }

  TokenResponse response;
  response.access_token = *access_token;
  response.token_type = optional_string(j, "token_type").value_or("Bearer");
  response.expires_in = optional_int(j, "expires_in");
  response.refresh_token = optional_string(j, "refresh_token");
  response.scope = optional_string(j, "scope");
  return Result<TokenResponse>::success(std::move(response));
}

// ============================================================
// StoredToken
// ============================================================

StoredToken StoredToken::from_response(const TokenResponse& response, const std::string& server_url) {
  auto now = clock::now();

  StoredToken token;
  token.access_token = response.access_token;
  token.token_type = response.token_type;
  token.refresh_token = response.refresh_token;
  token.scope = response.scope;
  if (response.expires_in) {
    token.expires_at = now + std::chrono::seconds(*response.expires_in);
  }
  token.server_url = server_url;
  token.created_at = now;
  token.updated_at = now;
  return token;
}

StoredToken StoredToken::refreshed(const TokenResponse& response) const {
  auto now = clock::now();

  StoredToken token = *this;
  token.access_token = response.access_token;
  token.token_type = response.token_type;
  if (response.refresh_token) token.refresh_token = response.refresh_token;
  if (response.scope) token.scope = response.scope;
  token.expires_at = response.expires_in ? std::optional<Timestamp>(now + std::chrono::seconds(*response.expires_in)) : std::nullopt;
  token.updated_at = now;
  return token;
}

json StoredToken::to_json() const {
  json j = {
      {"access_token", access_token},
      {"token_type", token_type},
      {"server_url", server_url},
      {"created_at", clock::format_iso8601(created_at)},
      {"updated_at", clock::format_iso8601(updated_at)},
  };
  if (refresh_token) j["refresh_token"] = *refresh_token;
  if (scope) j["scope"] = *scope;
  if (expires_at) j["expires_at"] = clock::format_iso8601(*expires_at);
  return j;
}

Result<StoredToken> StoredToken::from_json(const json& j) {
  if (!j.is_object()) {
    return Result<StoredToken>::failure(ErrorKind::Json, "token file is not a JSON object");
  }

  auto access_token = required_string(j, "access_token");
  if (!access_token) {
    return Result<StoredToken>::failure(ErrorKind::Json, "token file missing access_token");
  }

  StoredToken token;
  token.access_token = *access_token;
  token.token_type = optional_string(j, "token_type").value_or("Bearer");
  token.refresh_token = optional_string(j, "refresh_token");
  token.scope = optional_string(j, "scope");
  token.server_url = optional_string(j, "server_url").value_or("");

  if (auto expires = optional_string(j, "expires_at")) {
    auto parsed = clock::parse_iso8601(*expires);
    if (!parsed) {
      return Result<StoredToken>::failure(ErrorKind::Json, "invalid expires_at: " + *expires);
    }
    token.expires_at = *parsed;
  }

  auto now = clock::now();
  auto created = optional_string(j, "created_at");
  auto updated = optional_string(j, "updated_at");
  token.created_at = created ? clock::parse_iso8601(*created).value_or(now) : now;
  token.updated_at = updated ? clock::parse_iso8601(*updated).value_or(token.created_at) : token.created_at;

  return Result<StoredToken>::success(std::move(token));
}

// ============================================================
// LockfileRecord
// ============================================================

json LockfileRecord::to_json() const {
  return json{
      {"pid", pid},
      {"port", port},
      {"timestamp", clock::to_unix_seconds(timestamp)},
      {"server_url_hash", server_url_hash},
  };
}

Result<LockfileRecord> LockfileRecord::from_json(const json& j) {
  if (!j.is_object() || !j.contains("pid") || !j.contains("port") || !j.contains("timestamp")) {
    return Result<LockfileRecord>::failure(ErrorKind::Json, "lock file missing pid, port or timestamp");
  }

  const auto& pid = j.at("pid");
  const auto& port = j.at("port");
  if (!pid.is_number_unsigned() || pid.get<uint64_t>() == 0 || pid.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
    return Result<LockfileRecord>::failure(ErrorKind::Json, "lock file pid out of range: " + pid.dump());
  }
  if (!port.is_number_unsigned() || port.get<uint64_t>() == 0 || port.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
    return Result<LockfileRecord>::failure(ErrorKind::Json, "lock file port out of range: " + port.dump());
  }

  try {
    LockfileRecord record;
    record.pid = pid.get<uint32_t>();
    record.port = port.get<uint16_t>();
    record.timestamp = clock::from_unix_seconds(j.at("timestamp").get<int64_t>());
    record.server_url_hash = j.value("server_url_hash", "");
    return Result<LockfileRecord>::success(std::move(record));
  } catch (const json::exception& e) {
    return Result<LockfileRecord>::failure(ErrorKind::Json, std::string("invalid lock file: ") + e.what());
  }
}

}  // namespace mcp_remote::oauth
