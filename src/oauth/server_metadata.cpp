#include "oauth/server_metadata.hpp"

#include <spdlog/spdlog.h>

#include "net/url.hpp"

namespace mcp_remote::oauth {

ServerMetadata fallback_server_metadata(const std::string& base_url) {
  auto base = net::trim_trailing_slashes(base_url);

  ServerMetadata metadata;
  metadata.issuer = base;
  metadata.authorization_endpoint = base + "/oauth/authorize";
  metadata.token_endpoint = base + "/oauth/token";
  metadata.registration_endpoint = base + "/oauth/register";
  metadata.jwks_uri = base + "/oauth/jwks";
  metadata.response_types_supported = std::vector<std::string>{"code"};
  metadata.grant_types_supported = std::vector<std::string>{"authorization_code", "refresh_token"};
  // "none" for public clients with PKCE
  metadata.token_endpoint_auth_methods_supported = std::vector<std::string>{"client_secret_basic", "client_secret_post", "none"};
  metadata.scopes_supported = std::vector<std::string>{"mcp", "openid"};
  metadata.code_challenge_methods_supported = std::vector<std::string>{"S256", "plain"};
  return metadata;
}

ServerMetadataResolver::ServerMetadataResolver(net::HttpRequester& http) : http_(http) {}

ServerMetadata ServerMetadataResolver::discover(const std::string& base_url) {
  auto well_known = net::trim_trailing_slashes(base_url) + "/.well-known/oauth-authorization-server";
  spdlog::info("[Discovery] Fetching {}", well_known);

  auto response = http_.get(well_known, {{"Accept", "application/json"}}).get();

  if (!response.error.empty()) {
    spdlog::warn("[Discovery] Request failed: {}, using fallback metadata", response.error);
    return fallback_server_metadata(base_url);
  }
  if (!response.ok()) {
    spdlog::warn("[Discovery] HTTP {}, using fallback metadata", response.status_code);
    return fallback_server_metadata(base_url);
  }

  json doc;
  try {
    doc = json::parse(response.body);
  } catch (const json::exception& e) {
    spdlog::warn("[Discovery] Malformed metadata document: {}, using fallback metadata", e.what());
    return fallback_server_metadata(base_url);
  }

  auto metadata = ServerMetadata::from_json(doc);
  if (metadata.failed()) {
    spdlog::warn("[Discovery] {}, using fallback metadata", metadata.error->message);
    return fallback_server_metadata(base_url);
  }

  spdlog::debug("[Discovery] issuer={} authorization_endpoint={} token_endpoint={}", metadata.value->issuer,
                metadata.value->authorization_endpoint, metadata.value->token_endpoint);
  return std::move(*metadata.value);
}

}  // namespace mcp_remote::oauth
