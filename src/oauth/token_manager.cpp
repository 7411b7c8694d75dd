#include "oauth/token_manager.hpp"

#include <spdlog/spdlog.h>

#include "core/clock.hpp"
#include "core/json_file.hpp"
#include "net/url.hpp"

namespace mcp_remote::oauth {

namespace fs = std::filesystem;

TokenManager::TokenManager(net::HttpRequester& http, fs::path auth_dir) : http_(http), auth_dir_(std::move(auth_dir)) {}

std::string TokenManager::token_file_name(const std::string& server_url) {
  std::string name;
  name.reserve(server_url.size() + 5);

  for (size_t i = 0; i < server_url.size(); ++i) {
    if (server_url.compare(i, 3, "://") == 0) {
      name += '_';
      i += 2;
      continue;
    }
    char c = server_url[i];
    if (c == '/' || c == ':' || c == '?' || c == '&') {
      name += '_';
    } else {
      name += c;
    }
  }

  return name + ".json";
}

fs::path TokenManager::token_path(const std::string& server_url) const {
  return auth_dir_ / token_file_name(server_url);
}

Result<TokenResponse> TokenManager::post_token_request(const std::string& endpoint, const std::map<std::string, std::string>& params,
                                                       ErrorKind failure_kind) {
  auto response = http_
                      .post(endpoint, net::build_form_body(params),
                            {{"Content-Type", "application/x-www-form-urlencoded"}, {"Accept", "application/json"}})
                      .get();

  if (!response.error.empty()) {
    return Result<TokenResponse>::failure(ErrorKind::Http, "Token request failed: " + response.error);
  }

  if (!response.ok()) {
    spdlog::warn("[Token] {} failed: HTTP {} - {}", params.at("grant_type"), response.status_code, response.body);
    Error error{failure_kind, "Token endpoint returned " + std::to_string(response.status_code) + ": " + response.body, response.status_code};
    return Result<TokenResponse>::failure(std::move(error));
  }

  json doc;
  try {
    doc = json::parse(response.body);
  } catch (const json::exception& e) {
    return Result<TokenResponse>::failure(ErrorKind::Json, std::string("Invalid token response: ") + e.what());
  }

  return TokenResponse::from_json(doc);
}

Result<StoredToken> TokenManager::exchange_code_for_token(const ServerMetadata& metadata, const std::string& client_id,
                                                          const std::optional<std::string>& client_secret, const std::string& code,
                                                          const std::string& redirect_uri, const std::string& code_verifier,
                                                          const std::string& server_url) {
  spdlog::info("[Token] Exchanging authorization code at {}", metadata.token_endpoint);

  std::map<std::string, std::string> params = {
      {"grant_type", "authorization_code"},
      {"client_id", client_id},
      {"code", code},
      {"redirect_uri", redirect_uri},
      {"code_verifier", code_verifier},
  };
  if (client_secret) {
    params["client_secret"] = *client_secret;
  }

  auto response = post_token_request(metadata.token_endpoint, params, ErrorKind::TokenExchange);
  if (response.failed()) {
    return Result<StoredToken>::failure(*response.error);
  }

  auto token = StoredToken::from_response(*response.value, server_url);
  auto saved = save_token(token);
  if (saved.failed()) {
    return Result<StoredToken>::failure(*saved.error);
  }

  spdlog::info("[Token] Obtained access token for {}", server_url);
  return Result<StoredToken>::success(std::move(token));
}

Result<StoredToken> TokenManager::refresh_token(const ServerMetadata& metadata, const std::string& client_id,
                                                const std::optional<std::string>& client_secret, const StoredToken& stored) {
  if (!stored.refresh_token) {
    return Result<StoredToken>::failure(ErrorKind::TokenRefresh, "No refresh token available");
  }

  spdlog::info("[Token] Refreshing access token for {}", stored.server_url);

  std::map<std::string, std::string> params = {
      {"grant_type", "refresh_token"},
      {"client_id", client_id},
      {"refresh_token", *stored.refresh_token},
  };
  if (client_secret) {
    params["client_secret"] = *client_secret;
  }
  if (stored.scope) {
    params["scope"] = *stored.scope;
  }

  auto response = post_token_request(metadata.token_endpoint, params, ErrorKind::TokenRefresh);
  if (response.failed()) {
    return Result<StoredToken>::failure(*response.error);
  }

  auto token = stored.refreshed(*response.value);
  auto saved = save_token(token);
  if (saved.failed()) {
    return Result<StoredToken>::failure(*saved.error);
  }

  return Result<StoredToken>::success(std::move(token));
}

Result<std::optional<StoredToken>> TokenManager::load_token(const std::string& server_url) const {
  auto path = token_path(server_url);
  auto doc = read_json_file(path);
  if (doc.failed()) {
    return Result<std::optional<StoredToken>>::failure(ErrorKind::TokenStorage, doc.error->message);
  }
  if (!doc.value->has_value()) {
    return Result<std::optional<StoredToken>>::success(std::nullopt);
  }

  auto token = StoredToken::from_json(**doc.value);
  if (token.failed()) {
    return Result<std::optional<StoredToken>>::failure(ErrorKind::TokenStorage, path.string() + ": " + token.error->message);
  }
  if (token.value->server_url.empty()) {
    token.value->server_url = server_url;
  }

  spdlog::debug("[Token] Loaded token from {}", path.string());
  return Result<std::optional<StoredToken>>::success(std::move(*token.value));
}

Status TokenManager::save_token(const StoredToken& token) const {
  auto path = token_path(token.server_url);
  auto status = write_json_file(path, token.to_json(), true);
  if (status.failed()) {
    return Status::failure(ErrorKind::TokenStorage, status.error->message);
  }
  spdlog::debug("[Token] Saved token to {}", path.string());
  return status;
}

Status TokenManager::delete_token(const std::string& server_url) const {
  auto status = remove_file(token_path(server_url));
  if (status.failed()) {
    return Status::failure(ErrorKind::TokenStorage, status.error->message);
  }
  return status;
}

bool TokenManager::is_token_expired(const StoredToken& token, std::chrono::seconds buffer) {
  if (!token.expires_at) {
    return false;
  }
  return clock::now() + buffer >= *token.expires_at;
}

Result<std::string> TokenManager::get_valid_token(const ServerMetadata& metadata, const std::string& client_id,
                                                  const std::optional<std::string>& client_secret, const std::string& server_url) {
  auto loaded = load_token(server_url);
  if (loaded.failed()) {
    return Result<std::string>::failure(*loaded.error);
  }
  if (!loaded.value->has_value()) {
    return Result<std::string>::failure(ErrorKind::TokenStorage, "No stored token found");
  }

  const StoredToken& stored = **loaded.value;
  if (!is_token_expired(stored, kExpiryBuffer)) {
    return Result<std::string>::success(stored.access_token);
  }

  spdlog::info("[Token] Stored token expired or expiring soon");
  auto refreshed = refresh_token(metadata, client_id, client_secret, stored);
  if (refreshed.failed()) {
    return Result<std::string>::failure(*refreshed.error);
  }
  return Result<std::string>::success(refreshed.value->access_token);
}

}  // namespace mcp_remote::oauth
