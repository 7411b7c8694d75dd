#include "core/error.hpp"

namespace mcp_remote {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Http:
      return "HTTP request failed";
    case ErrorKind::Json:
      return "JSON serialization/deserialization error";
    case ErrorKind::Io:
      return "IO error";
    case ErrorKind::TokenStorage:
      return "Token storage error";
    case ErrorKind::BrowserLaunch:
      return "Browser launch error";
    case ErrorKind::CallbackServer:
      return "Callback server error";
    case ErrorKind::ClientRegistration:
      return "Dynamic client registration failed";
    case ErrorKind::StateMismatch:
      return "State verification failed";
    case ErrorKind::TokenExchange:
      return "Token exchange failed";
    case ErrorKind::TokenRefresh:
      return "Token refresh failed";
    case ErrorKind::AuthTimeout:
      return "Authentication timeout";
    case ErrorKind::InvalidConfiguration:
      return "Invalid configuration";
    case ErrorKind::MissingParameter:
      return "Missing required parameter";
    case ErrorKind::AuthorizationDenied:
      return "Authorization denied";
    case ErrorKind::Cancelled:
      return "Cancelled";
  }
  return "Unknown error";
}

std::string Error::to_string() const {
  if (message.empty()) {
    return mcp_remote::to_string(kind);
  }
  return mcp_remote::to_string(kind) + ": " + message;
}

}  // namespace mcp_remote
