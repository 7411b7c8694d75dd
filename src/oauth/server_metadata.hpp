#pragma once

#include <string>

#include "net/http_client.hpp"
#include "oauth/types.hpp"

namespace mcp_remote::oauth {

// Synthetic metadata rooted at the server URL (trailing '/' stripped)
ServerMetadata fallback_server_metadata(const std::string& base_url);

// RFC 8414 discovery with fallback
class ServerMetadataResolver {
 public:
  explicit ServerMetadataResolver(net::HttpRequester& http);

  // GET {base}/.well-known/oauth-authorization-server.
  // Any failure (transport, non-2xx, bad JSON, missing required members)
  // yields fallback_server_metadata(base_url). Never fails.
  ServerMetadata discover(const std::string& base_url);

 private:
  net::HttpRequester& http_;
};

}  // namespace mcp_remote::oauth
