#pragma once

#include <optional>
#include <string>

#include "net/http_client.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// RFC 7591 dynamic client registration
class ClientRegistrar {
 public:
  explicit ClientRegistrar(net::HttpRequester& http);

  // ClientRegistration error (no request sent) when the metadata has no
  // registration endpoint, or when the server answers non-2xx.
  // Json error when the response lacks client_id.
  Result<ClientRegistrationResponse> register_client(const ServerMetadata& metadata, const std::string& redirect_uri,
                                                     const std::optional<std::string>& client_name = std::nullopt);

  // Registration request document
  static json build_request(const std::string& redirect_uri, const std::optional<std::string>& client_name);

 private:
  net::HttpRequester& http_;
};

}  // namespace mcp_remote::oauth
