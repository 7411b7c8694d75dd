#pragma once

#include <string>

namespace mcp_remote {

// Error categories surfaced by the authorization engine
enum class ErrorKind {
  Http,                  // Network failure or unusable HTTP response
  Json,                  // Malformed or incomplete JSON document
  Io,                    // Filesystem failure
  TokenStorage,          // Token or lock file missing/unreadable
  BrowserLaunch,         // No browser could be opened
  CallbackServer,        // Callback listener bind/parse failure
  ClientRegistration,    // Dynamic client registration rejected or unsupported
  StateMismatch,         // Callback state differs from the generated one (CSRF)
  TokenExchange,         // Authorization code exchange rejected
  TokenRefresh,          // Refresh grant rejected or impossible
  AuthTimeout,           // User did not finish authorization in time
  InvalidConfiguration,  // Unusable configuration
  MissingParameter,      // Callback without code/state
  AuthorizationDenied,   // Authorization server redirected with ?error=
  Cancelled              // Caller cancelled the flow
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Http;
  std::string message;
  int status_code = 0;  // HTTP status when the error came from a response

  // "<kind description>: <message>"
  std::string to_string() const;
};

}  // namespace mcp_remote
