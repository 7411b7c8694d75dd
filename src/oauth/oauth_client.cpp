#include "oauth/oauth_client.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

#include "core/clock.hpp"
#include "net/url.hpp"
#include "oauth/callback_server.hpp"
#include "oauth/pkce.hpp"

namespace mcp_remote::oauth {

namespace {

// Removes our lock file on every exit of the interactive flow
class LockfileGuard {
 public:
  explicit LockfileGuard(CoordinationManager& coordination) : coordination_(coordination) {}

  ~LockfileGuard() {
    if (!active_) return;
    auto status = coordination_.delete_lockfile();
    if (status.failed()) {
      spdlog::warn("[OAuth] {}", status.error->to_string());
    }
  }

  void arm() {
    active_ = true;
  }

 private:
  CoordinationManager& coordination_;
  bool active_ = false;
};

}  // namespace

std::string to_string(AuthState state) {
  switch (state) {
    case AuthState::NoToken:
      return "no_token";
    case AuthState::Discovering:
      return "discovering";
    case AuthState::Registering:
      return "registering";
    case AuthState::CheckingCache:
      return "checking_cache";
    case AuthState::Coordinating:
      return "coordinating";
    case AuthState::AwaitingAuthorization:
      return "awaiting_authorization";
    case AuthState::ExchangingCode:
      return "exchanging_code";
    case AuthState::Valid:
      return "valid";
    case AuthState::Failed:
      return "failed";
  }
  return "unknown";
}

OAuthClient::OAuthClient(OAuthConfig config, std::shared_ptr<net::HttpRequester> http, std::shared_ptr<BrowserLauncher> browser,
                         std::shared_ptr<ProcessProbe> probe)
    : config_(std::move(config)),
      http_(std::move(http)),
      browser_(std::move(browser)),
      resolver_(*http_),
      registrar_(*http_),
      token_manager_(*http_, config_.auth_dir),
      coordination_(config_.auth_dir, config_.server_url, config_.coordination, std::move(probe)),
      metadata_(config_.server_metadata) {
  if (config_.static_client_info) {
    credentials_ = *config_.static_client_info;
  }
}

std::shared_ptr<OAuthClient> OAuthClient::create(asio::io_context& io_ctx, OAuthConfig config) {
  auto http = std::make_shared<net::HttpClient>(io_ctx);
  auto browser = std::make_shared<SystemBrowserLauncher>();
  return std::make_shared<OAuthClient>(std::move(config), std::move(http), std::move(browser));
}

void OAuthClient::set_state_callback(StateCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  state_callback_ = std::move(callback);
}

void OAuthClient::set_state(AuthState state) {
  state_ = state;
  spdlog::debug("[OAuth] State -> {}", to_string(state));

  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (state_callback_) {
    state_callback_(state);
  }
}

void OAuthClient::cancel() {
  spdlog::info("[OAuth] Cancel requested");
  cancelled_ = true;
}

Status OAuthClient::clear_tokens() {
  spdlog::info("[OAuth] Clearing stored tokens for {}", config_.server_url);
  auto status = token_manager_.delete_token(config_.server_url);
  if (status.ok()) {
    set_state(AuthState::NoToken);
  }
  return status;
}

bool OAuthClient::has_stored_token() const {
  auto token = token_manager_.load_token(config_.server_url);
  return token.ok() && token.value->has_value();
}

std::string OAuthClient::build_authorization_url(const ServerMetadata& metadata, const std::string& client_id,
                                                 const AuthorizationSession& session) const {
  std::vector<std::pair<std::string, std::string>> params = {
      {"response_type", "code"},
      {"client_id", client_id},
      {"redirect_uri", session.redirect_uri},
      {"state", session.state},
      {"code_challenge", session.pkce.code_challenge},
      {"code_challenge_method", session.pkce.code_challenge_method},
  };
  if (config_.scope) {
    params.emplace_back("scope", *config_.scope);
  }
  return net::append_query(metadata.authorization_endpoint, params);
}

Result<std::string> OAuthClient::get_access_token() {
  std::lock_guard<std::mutex> lock(flow_mutex_);
  cancelled_ = false;

  auto result = run_flow();
  if (result.ok()) {
    set_state(AuthState::Valid);
  } else {
    spdlog::error("[OAuth] {}", result.error->to_string());
    set_state(AuthState::Failed);
  }
  return result;
}

Result<ClientCredentials> OAuthClient::resolve_credentials(const ServerMetadata& metadata) {
  if (credentials_) {
    return Result<ClientCredentials>::success(*credentials_);
  }

  if (!metadata.registration_endpoint) {
    return Result<ClientCredentials>::failure(ErrorKind::InvalidConfiguration,
                                              "No client credentials configured and the server does not support dynamic client registration");
  }

  set_state(AuthState::Registering);

  // Register with the port the listener will try first, so the redirect URI matches
  auto port = find_available_port(config_.callback_port.value_or(0));
  if (port.failed()) {
    return Result<ClientCredentials>::failure(*port.error);
  }
  auto redirect_uri = "http://" + config_.callback_host + ":" + std::to_string(*port.value) + "/callback";

  auto registration = registrar_.register_client(metadata, redirect_uri, std::string("MCP Remote"));
  if (registration.failed()) {
    return Result<ClientCredentials>::failure(*registration.error);
  }

  credentials_ = registration.value->credentials();
  registered_port_ = *port.value;
  return Result<ClientCredentials>::success(*credentials_);
}

std::optional<Error> OAuthClient::check_cancelled() const {
  if (!cancelled_.load()) {
    return std::nullopt;
  }
  return Error{ErrorKind::Cancelled, "Authorization cancelled"};
}

Result<std::string> OAuthClient::run_flow() {
  // 1. Server metadata
  if (!metadata_) {
    set_state(AuthState::Discovering);
    metadata_ = resolver_.discover(config_.server_url);
  }
  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }
  const ServerMetadata& metadata = *metadata_;

  // 2. Client credentials
  auto credentials = resolve_credentials(metadata);
  if (credentials.failed()) {
    return Result<std::string>::failure(*credentials.error);
  }
  const auto& client = *credentials.value;
  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }

  // 3. Cached token (refreshed inside when close to expiry)
  set_state(AuthState::CheckingCache);
  auto cached = token_manager_.get_valid_token(metadata, client.client_id, client.client_secret, config_.server_url);
  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }
  if (cached.ok()) {
    spdlog::info("[OAuth] Using stored token for {}", config_.server_url);
    return cached;
  }
  spdlog::info("[OAuth] No usable stored token ({}), starting authorization", cached.error->to_string());

  // 4. Another process may already be authorizing against this server
  auto lock = coordination_.check_lockfile();
  if (lock.failed()) {
    spdlog::warn("[OAuth] {}", lock.error->to_string());
  } else if (lock.value->has_value()) {
    const auto& peer = **lock.value;
    spdlog::info("[OAuth] Authorization in progress in process {} (port {}), waiting", peer.pid, peer.port);
    set_state(AuthState::Coordinating);

    auto waited = coordination_.wait_for_authentication(peer.port, &cancelled_);
    if (waited.failed()) {
      if (waited.error->kind == ErrorKind::Cancelled) {
        return Result<std::string>::failure(*waited.error);
      }
      spdlog::warn("[OAuth] {}", waited.error->to_string());
    } else if (*waited.value) {
      auto shared = token_manager_.get_valid_token(metadata, client.client_id, client.client_secret, config_.server_url);
      if (shared.ok()) {
        spdlog::info("[OAuth] Using token obtained by process {}", peer.pid);
        return shared;
      }
      spdlog::info("[OAuth] Peer finished without a usable token ({})", shared.error->to_string());
    }
  }

  // 5-7. Interactive authorization
  return run_interactive_flow(metadata, client);
}

Result<std::string> OAuthClient::run_interactive_flow(const ServerMetadata& metadata, const ClientCredentials& credentials) {
  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }

  uint16_t preferred_port = registered_port_ ? *registered_port_ : config_.callback_port.value_or(0);
  CallbackServer server(preferred_port);
  auto bound = server.start();
  if (bound.failed()) {
    return Result<std::string>::failure(*bound.error);
  }
  if (registered_port_ && *bound.value != *registered_port_) {
    spdlog::warn("[OAuth] Callback port {} differs from registered port {}", *bound.value, *registered_port_);
  }

  LockfileGuard lock_guard(coordination_);
  auto created = coordination_.create_lockfile(*bound.value);
  if (created.failed()) {
    spdlog::warn("[OAuth] {}", created.error->to_string());
  } else {
    lock_guard.arm();
  }

  AuthorizationSession session;
  session.state = generate_state();
  session.pkce = PkceChallenge::generate();
  session.redirect_uri = server.callback_url(config_.callback_host);
  session.expiry = clock::now() + std::chrono::seconds(config_.auth_timeout_secs);

  auto url = build_authorization_url(metadata, credentials.client_id, session);
  spdlog::info("[OAuth] Waiting for authorization on {}", session.redirect_uri);
  set_state(AuthState::AwaitingAuthorization);

  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }
  auto launched = browser_->launch(url);
  if (launched.failed()) {
    spdlog::warn("[OAuth] {}", launched.error->to_string());
    print_authorization_url(std::cerr, url);
  }

  auto callback = server.wait_for_callback(std::chrono::seconds(config_.auth_timeout_secs), &cancelled_);
  if (callback.failed()) {
    return Result<std::string>::failure(*callback.error);
  }

  if (!constant_time_equals(callback.value->state, session.state)) {
    return Result<std::string>::failure(ErrorKind::StateMismatch, "State parameter mismatch, possible CSRF attack");
  }

  if (auto cancelled = check_cancelled()) {
    return Result<std::string>::failure(*cancelled);
  }

  set_state(AuthState::ExchangingCode);
  auto token = token_manager_.exchange_code_for_token(metadata, credentials.client_id, credentials.client_secret, callback.value->code,
                                                      session.redirect_uri, session.pkce.code_verifier, config_.server_url);
  if (token.failed()) {
    return Result<std::string>::failure(*token.error);
  }

  spdlog::info("[OAuth] Authorization complete for {}", config_.server_url);
  return Result<std::string>::success(token.value->access_token);
}

}  // namespace mcp_remote::oauth
