#pragma once

// Core types
#include "core/types.hpp"
#include "core/config.hpp"
#include "core/version.hpp"

// Network
#include "net/http_client.hpp"

// OAuth engine
#include "oauth/oauth_config.hpp"
#include "oauth/oauth_client.hpp"

// Transport-facing authentication
#include "auth/auth_provider.hpp"

// Logging
#include "log/log.h"

namespace mcp_remote {

inline std::string version() {
  return MCP_REMOTE_VERSION_STRING;
}

}  // namespace mcp_remote
