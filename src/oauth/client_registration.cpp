#include "oauth/client_registration.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"

namespace mcp_remote::oauth {

ClientRegistrar::ClientRegistrar(net::HttpRequester& http) : http_(http) {}

json ClientRegistrar::build_request(const std::string& redirect_uri, const std::optional<std::string>& client_name) {
  json request = {
      {"redirect_uris", json::array({redirect_uri})},
      {"scope", "mcp"},
      {"software_id", "mcp-remote"},
      {"software_version", MCP_REMOTE_VERSION_STRING},
      {"mcp_version", "2024-11-05"},
      {"application_type", "native"},
  };
  if (client_name) {
    request["client_name"] = *client_name;
  }
  return request;
}

Result<ClientRegistrationResponse> ClientRegistrar::register_client(const ServerMetadata& metadata, const std::string& redirect_uri,
                                                                    const std::optional<std::string>& client_name) {
  if (!metadata.registration_endpoint) {
    return Result<ClientRegistrationResponse>::failure(ErrorKind::ClientRegistration, "Server does not support dynamic client registration");
  }

  const auto& endpoint = *metadata.registration_endpoint;
  spdlog::info("[Registration] Registering client at {}", endpoint);

  auto body = build_request(redirect_uri, client_name).dump();
  auto response = http_.post(endpoint, body, {{"Content-Type", "application/json"}, {"Accept", "application/json"}}).get();

  if (!response.error.empty()) {
    return Result<ClientRegistrationResponse>::failure(ErrorKind::Http, "Registration request failed: " + response.error);
  }

  if (!response.ok()) {
    spdlog::warn("[Registration] Failed: HTTP {} - {}", response.status_code, response.body);
    Error error{ErrorKind::ClientRegistration, "Registration failed with status " + std::to_string(response.status_code) + ": " + response.body,
                response.status_code};
    return Result<ClientRegistrationResponse>::failure(std::move(error));
  }

  json doc;
  try {
    doc = json::parse(response.body);
  } catch (const json::exception& e) {
    return Result<ClientRegistrationResponse>::failure(ErrorKind::Json, std::string("Invalid registration response: ") + e.what());
  }

  auto registration = ClientRegistrationResponse::from_json(doc);
  if (registration.ok()) {
    spdlog::info("[Registration] Registered client {}", registration.value->client_id);
  }
  return registration;
}

}  // namespace mcp_remote::oauth
