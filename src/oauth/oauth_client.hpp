#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "net/http_client.hpp"
#include "oauth/browser.hpp"
#include "oauth/client_registration.hpp"
#include "oauth/coordination.hpp"
#include "oauth/oauth_config.hpp"
#include "oauth/server_metadata.hpp"
#include "oauth/token_manager.hpp"

namespace mcp_remote::oauth {

enum class AuthState {
  NoToken,
  Discovering,
  Registering,
  CheckingCache,
  Coordinating,
  AwaitingAuthorization,
  ExchangingCode,
  Valid,
  Failed
};

std::string to_string(AuthState state);

// OAuth 2.1 authorization code + PKCE flow for one MCP server.
//
// get_access_token() blocks. It waits on futures from the HttpRequester, so
// the io_context behind an asio HttpClient must be run by another thread.
class OAuthClient {
 public:
  using StateCallback = std::function<void(AuthState state)>;

  OAuthClient(OAuthConfig config, std::shared_ptr<net::HttpRequester> http, std::shared_ptr<BrowserLauncher> browser,
              std::shared_ptr<ProcessProbe> probe = nullptr);

  // Default collaborators: asio HttpClient on io_ctx, system browser
  static std::shared_ptr<OAuthClient> create(asio::io_context& io_ctx, OAuthConfig config);

  // Cached token, refreshed token, or a new one from the interactive flow.
  // One flow at a time per client; concurrent callers queue.
  Result<std::string> get_access_token();

  // Abort an in-flight callback or coordination wait (Cancelled error)
  void cancel();

  Status clear_tokens();

  bool has_stored_token() const;

  const std::string& server_url() const {
    return config_.server_url;
  }

  const OAuthConfig& config() const {
    return config_;
  }

  AuthState state() const {
    return state_.load();
  }

  void set_state_callback(StateCallback callback);

  // Authorization request URL for one session
  std::string build_authorization_url(const ServerMetadata& metadata, const std::string& client_id, const AuthorizationSession& session) const;

 private:
  Result<std::string> run_flow();
  Result<std::string> run_interactive_flow(const ServerMetadata& metadata, const ClientCredentials& credentials);
  Result<ClientCredentials> resolve_credentials(const ServerMetadata& metadata);
  void set_state(AuthState state);

  // Cancelled error once cancel() was called during this flow
  std::optional<Error> check_cancelled() const;

  OAuthConfig config_;
  std::shared_ptr<net::HttpRequester> http_;
  std::shared_ptr<BrowserLauncher> browser_;

  ServerMetadataResolver resolver_;
  ClientRegistrar registrar_;
  TokenManager token_manager_;
  CoordinationManager coordination_;

  // Cached for the lifetime of the client
  std::optional<ServerMetadata> metadata_;
  std::optional<ClientCredentials> credentials_;
  std::optional<uint16_t> registered_port_;

  std::mutex flow_mutex_;
  std::atomic<bool> cancelled_{false};
  std::atomic<AuthState> state_{AuthState::NoToken};

  std::mutex callback_mutex_;
  StateCallback state_callback_;
};

}  // namespace mcp_remote::oauth
