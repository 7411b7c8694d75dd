#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>

#include "core/clock.hpp"
#include "core/json_file.hpp"
#include "net/http_client.hpp"
#include "net/url.hpp"
#include "oauth/oauth_client.hpp"
#include "oauth/pkce.hpp"
#include "test_helpers.hpp"

using namespace mcp_remote;
using namespace mcp_remote::oauth;

namespace fs = std::filesystem;

namespace {

const std::string kServer = "https://mcp.example.com";

std::map<std::string, std::string> query_of(const std::string& url) {
  auto question = url.find('?');
  return question == std::string::npos ? std::map<std::string, std::string>{} : net::parse_query(url.substr(question + 1));
}

// Plays the user: follows the authorization URL by calling the redirect URI
// on the real callback listener.
class FakeBrowser : public BrowserLauncher {
 public:
  enum class Mode { Approve, WrongState, Deny, Ignore };

  explicit FakeBrowser(asio::io_context& io_ctx) : client_(io_ctx) {}

  // Outstanding requests hold handlers that reference client_
  ~FakeBrowser() override {
    for (auto& response : pending_) {
      response.wait();
    }
  }

  Status launch(const std::string& url) override {
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.push_back(url);

    auto params = query_of(url);
    const std::string redirect = params["redirect_uri"];
    switch (mode) {
      case Mode::Approve:
        pending_.push_back(client_.get(redirect + "?code=the-code&state=" + net::url_encode(params["state"])));
        if (on_redirected) {
          pending_.back().wait();
          on_redirected();
        }
        break;
      case Mode::WrongState:
        pending_.push_back(client_.get(redirect + "?code=the-code&state=forged"));
        break;
      case Mode::Deny:
        pending_.push_back(client_.get(redirect + "?error=access_denied&error_description=User%20said%20no"));
        break;
      case Mode::Ignore:
        break;
    }
    return Status::success();
  }

  std::string launcher_name() const override {
    return "fake";
  }

  std::vector<std::string> urls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_;
  }

  Mode mode = Mode::Approve;

  // Called once the listener has answered the approved redirect
  std::function<void()> on_redirected;

 private:
  net::HttpClient client_;
  mutable std::mutex mutex_;
  std::vector<std::string> urls_;
  std::vector<std::future<net::HttpResponse>> pending_;
};

class FakeProcessProbe : public ProcessProbe {
 public:
  explicit FakeProcessProbe(std::set<uint32_t> alive) : alive_(std::move(alive)) {}

  bool is_alive(uint32_t pid) const override {
    return alive_.count(pid) > 0;
  }

 private:
  std::set<uint32_t> alive_;
};

json metadata_doc(bool with_registration = true) {
  json doc = {
      {"issuer", kServer},
      {"authorization_endpoint", kServer + "/authorize"},
      {"token_endpoint", kServer + "/token"},
      {"response_types_supported", {"code"}},
      {"code_challenge_methods_supported", {"S256"}},
  };
  if (with_registration) {
    doc["registration_endpoint"] = kServer + "/register";
  }
  return doc;
}

ServerMetadata static_metadata() {
  return *ServerMetadata::from_json(metadata_doc(false)).value;
}

}  // namespace

class OAuthClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = test_util::make_temp_dir("mcp_remote_flow");
    browser_ = std::make_shared<FakeBrowser>(io_.context());

    http_->on("GET", kServer + "/.well-known/oauth-authorization-server", [](const test_util::RecordedRequest&) {
      return test_util::json_response(200, metadata_doc());
    });
    http_->on("POST", kServer + "/register", [](const test_util::RecordedRequest&) {
      return test_util::json_response(201, {{"client_id", "client-abc"}, {"client_id_issued_at", 1700000000}});
    });
    http_->on("POST", kServer + "/token", [](const test_util::RecordedRequest& request) {
      auto form = net::parse_query(request.options.body);
      if (form["grant_type"] == "refresh_token") {
        return test_util::json_response(200, {{"access_token", "tok456"}, {"token_type", "Bearer"}, {"expires_in", 3600}});
      }
      return test_util::json_response(
          200, {{"access_token", "tok123"}, {"token_type", "Bearer"}, {"expires_in", 3600}, {"refresh_token", "ref123"}});
    });
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  OAuthConfigBuilder builder() {
    CoordinationOptions coordination;
    coordination.poll_interval = std::chrono::milliseconds(20);
    coordination.max_wait = std::chrono::seconds(5);

    OAuthConfigBuilder builder(kServer);
    builder.with_auth_dir(test_dir_).with_auth_timeout(5).with_coordination(coordination);
    return builder;
  }

  std::unique_ptr<OAuthClient> make_client(const OAuthConfigBuilder& b, std::shared_ptr<ProcessProbe> probe = nullptr) {
    auto config = b.build();
    EXPECT_TRUE(config.ok());
    return std::make_unique<OAuthClient>(*config.value, http_, browser_, std::move(probe));
  }

  void store_token(const std::string& access_token, std::chrono::seconds expires_in, std::optional<std::string> refresh_token) {
    TokenResponse response;
    response.access_token = access_token;
    response.expires_in = expires_in.count();
    response.refresh_token = std::move(refresh_token);
    TokenManager manager(*http_, test_dir_);
    ASSERT_TRUE(manager.save_token(StoredToken::from_response(response, kServer)).ok());
  }

  std::optional<StoredToken> stored_token() {
    TokenManager manager(*http_, test_dir_);
    auto token = manager.load_token(kServer);
    return token.ok() ? *token.value : std::nullopt;
  }

  fs::path lockfile() const {
    return test_dir_ / (hash_server_url(kServer) + "_lock.json");
  }

  test_util::IoThread io_;
  fs::path test_dir_;
  std::shared_ptr<test_util::FakeHttpRequester> http_ = std::make_shared<test_util::FakeHttpRequester>();
  std::shared_ptr<FakeBrowser> browser_;
};

TEST_F(OAuthClientTest, FullFlow) {
  auto client = make_client(builder());

  auto token = client->get_access_token();
  ASSERT_TRUE(token.ok()) << token.error->to_string();
  EXPECT_EQ(*token.value, "tok123");
  EXPECT_EQ(client->state(), AuthState::Valid);

  // Authorization request
  ASSERT_EQ(browser_->urls().size(), 1u);
  auto url = browser_->urls()[0];
  EXPECT_EQ(url.rfind(kServer + "/authorize?", 0), 0u);
  auto params = query_of(url);
  EXPECT_EQ(params["response_type"], "code");
  EXPECT_EQ(params["client_id"], "client-abc");
  EXPECT_EQ(params["code_challenge_method"], "S256");
  EXPECT_EQ(params["code_challenge"].size(), 43u);
  EXPECT_GE(params["state"].size(), 32u);
  EXPECT_EQ(params["redirect_uri"].rfind("http://localhost:", 0), 0u);
  EXPECT_EQ(params.count("scope"), 0u);

  // Registration used the same redirect URI
  auto requests = http_->requests();
  auto registration = std::find_if(requests.begin(), requests.end(), [](const test_util::RecordedRequest& r) {
    return r.url == kServer + "/register";
  });
  ASSERT_NE(registration, requests.end());
  auto registration_body = json::parse(registration->options.body);
  EXPECT_EQ(registration_body["redirect_uris"][0], params["redirect_uri"]);
  EXPECT_EQ(registration_body["client_name"], "MCP Remote");

  // Code exchange
  auto exchange = std::find_if(requests.begin(), requests.end(), [](const test_util::RecordedRequest& r) {
    return r.url == kServer + "/token";
  });
  ASSERT_NE(exchange, requests.end());
  auto form = net::parse_query(exchange->options.body);
  EXPECT_EQ(form["grant_type"], "authorization_code");
  EXPECT_EQ(form["code"], "the-code");
  EXPECT_EQ(form["client_id"], "client-abc");
  EXPECT_EQ(form["redirect_uri"], params["redirect_uri"]);
  EXPECT_TRUE(verify_pkce_challenge(form["code_verifier"], params["code_challenge"]));

  // Persisted, lock released
  auto stored = stored_token();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->access_token, "tok123");
  EXPECT_EQ(stored->refresh_token.value_or(""), "ref123");
  EXPECT_FALSE(fs::exists(lockfile()));

  // Second call is served from the cache
  auto again = client->get_access_token();
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(*again.value, "tok123");
  EXPECT_EQ(http_->count("POST", kServer + "/register"), 1u);
  EXPECT_EQ(http_->count("POST", kServer + "/token"), 1u);
  EXPECT_EQ(browser_->urls().size(), 1u);
}

TEST_F(OAuthClientTest, StateTransitions) {
  auto client = make_client(builder());

  std::vector<AuthState> states;
  client->set_state_callback([&states](AuthState state) {
    states.push_back(state);
  });

  ASSERT_TRUE(client->get_access_token().ok());

  std::vector<AuthState> expected = {AuthState::Discovering, AuthState::Registering, AuthState::CheckingCache,
                                     AuthState::AwaitingAuthorization, AuthState::ExchangingCode, AuthState::Valid};
  EXPECT_EQ(states, expected);
}

TEST_F(OAuthClientTest, StateMismatchRejected) {
  browser_->mode = FakeBrowser::Mode::WrongState;
  auto client = make_client(builder());

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::StateMismatch);
  EXPECT_EQ(http_->count("POST", kServer + "/token"), 0u);
  EXPECT_EQ(client->state(), AuthState::Failed);
  EXPECT_FALSE(stored_token().has_value());
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, UserDenied) {
  browser_->mode = FakeBrowser::Mode::Deny;
  auto client = make_client(builder());

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::AuthorizationDenied);
  EXPECT_NE(token.error->message.find("access_denied"), std::string::npos);
  EXPECT_EQ(http_->count("POST", kServer + "/token"), 0u);
}

TEST_F(OAuthClientTest, TimeoutReleasesLock) {
  browser_->mode = FakeBrowser::Mode::Ignore;
  auto b = builder();
  b.with_auth_timeout(1);
  auto client = make_client(b);

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::AuthTimeout);
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, CancelAbortsWait) {
  browser_->mode = FakeBrowser::Mode::Ignore;
  auto b = builder();
  b.with_auth_timeout(300);
  auto client = make_client(b);

  std::thread canceller([&client]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    client->cancel();
  });
  auto token = client->get_access_token();
  canceller.join();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::Cancelled);
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, CancelDuringDiscovery) {
  OAuthClient* target = nullptr;
  http_->on("GET", kServer + "/.well-known/oauth-authorization-server", [&target](const test_util::RecordedRequest&) {
    target->cancel();
    return test_util::json_response(200, metadata_doc());
  });
  auto client = make_client(builder());
  target = client.get();

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::Cancelled);
  EXPECT_EQ(http_->count("POST", kServer + "/register"), 0u);
  EXPECT_TRUE(browser_->urls().empty());
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, CancelDuringRefresh) {
  store_token("tok-old", std::chrono::seconds(30), std::string("ref-old"));
  OAuthClient* target = nullptr;
  http_->on("POST", kServer + "/token", [&target](const test_util::RecordedRequest&) {
    target->cancel();
    return test_util::json_response(500, {{"error", "server_error"}});
  });
  auto b = builder();
  b.with_server_metadata(static_metadata()).with_static_client_info(StaticClientInfo{"static-client", std::nullopt});
  auto client = make_client(b);
  target = client.get();

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::Cancelled);
  EXPECT_TRUE(browser_->urls().empty());
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, CancelAfterCallbackSkipsExchange) {
  auto client = make_client(builder());
  browser_->on_redirected = [&client]() {
    client->cancel();
  };

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::Cancelled);
  EXPECT_EQ(browser_->urls().size(), 1u);
  EXPECT_EQ(http_->count("POST", kServer + "/token"), 0u);
  EXPECT_FALSE(stored_token().has_value());
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, CancelledFlowDoesNotStickToNextCall) {
  OAuthClient* target = nullptr;
  bool cancel_once = true;
  http_->on("GET", kServer + "/.well-known/oauth-authorization-server", [&target, &cancel_once](const test_util::RecordedRequest&) {
    if (cancel_once) {
      cancel_once = false;
      target->cancel();
    }
    return test_util::json_response(200, metadata_doc());
  });
  auto client = make_client(builder());
  target = client.get();

  EXPECT_EQ(client->get_access_token().error->kind, ErrorKind::Cancelled);

  auto token = client->get_access_token();
  ASSERT_TRUE(token.ok()) << token.error->to_string();
  EXPECT_EQ(*token.value, "tok123");
}

TEST_F(OAuthClientTest, RefreshNearExpiry) {
  store_token("tok-old", std::chrono::seconds(30), std::string("ref-old"));
  auto b = builder();
  b.with_server_metadata(static_metadata()).with_static_client_info(StaticClientInfo{"static-client", std::string("s3cret")});
  auto client = make_client(b);

  auto token = client->get_access_token();

  ASSERT_TRUE(token.ok()) << token.error->to_string();
  EXPECT_EQ(*token.value, "tok456");
  ASSERT_EQ(http_->requests().size(), 1u);

  auto form = net::parse_query(http_->requests()[0].options.body);
  EXPECT_EQ(form["grant_type"], "refresh_token");
  EXPECT_EQ(form["refresh_token"], "ref-old");
  EXPECT_EQ(form["client_id"], "static-client");
  EXPECT_EQ(form["client_secret"], "s3cret");

  // Refresh response carried no refresh_token: the old one is kept
  auto stored = stored_token();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->access_token, "tok456");
  EXPECT_EQ(stored->refresh_token.value_or(""), "ref-old");
  EXPECT_TRUE(browser_->urls().empty());
}

TEST_F(OAuthClientTest, ValidCachedToken) {
  store_token("cached", std::chrono::seconds(3600), std::nullopt);
  auto b = builder();
  b.with_static_client_info(StaticClientInfo{"static-client", std::nullopt});
  auto client = make_client(b);

  auto token = client->get_access_token();

  ASSERT_TRUE(token.ok());
  EXPECT_EQ(*token.value, "cached");
  EXPECT_EQ(http_->count("GET", kServer + "/.well-known/oauth-authorization-server"), 1u);
  EXPECT_EQ(http_->count("POST", kServer + "/register"), 0u);
  EXPECT_EQ(http_->count("POST", kServer + "/token"), 0u);
  EXPECT_TRUE(client->has_stored_token());
}

TEST_F(OAuthClientTest, ExpiredWithoutRefreshTokenStartsFlow) {
  store_token("expired", std::chrono::seconds(0), std::nullopt);
  auto b = builder();
  b.with_server_metadata(static_metadata()).with_static_client_info(StaticClientInfo{"static-client", std::nullopt});
  auto client = make_client(b);

  auto token = client->get_access_token();

  ASSERT_TRUE(token.ok());
  EXPECT_EQ(*token.value, "tok123");
  EXPECT_EQ(browser_->urls().size(), 1u);
  EXPECT_EQ(query_of(browser_->urls()[0])["client_id"], "static-client");
}

TEST_F(OAuthClientTest, WaitsForPeerProcess) {
  const uint32_t peer_pid = 4242;
  auto probe = std::make_shared<FakeProcessProbe>(std::set<uint32_t>{peer_pid});

  // Another process holds the lock for this server
  LockfileRecord record{peer_pid, 9001, clock::now(), hash_server_url(kServer)};
  ASSERT_TRUE(write_json_file(lockfile(), record.to_json()).ok());

  auto b = builder();
  b.with_server_metadata(static_metadata()).with_static_client_info(StaticClientInfo{"static-client", std::nullopt});
  auto client = make_client(b, probe);

  std::vector<AuthState> states;
  client->set_state_callback([&states](AuthState state) {
    states.push_back(state);
  });

  std::thread peer([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    store_token("peer-token", std::chrono::seconds(3600), std::nullopt);
    std::error_code ec;
    fs::remove(lockfile(), ec);
  });
  auto token = client->get_access_token();
  peer.join();

  ASSERT_TRUE(token.ok()) << token.error->to_string();
  EXPECT_EQ(*token.value, "peer-token");
  EXPECT_TRUE(browser_->urls().empty());
  EXPECT_TRUE(http_->requests().empty());
  EXPECT_NE(std::find(states.begin(), states.end(), AuthState::Coordinating), states.end());
}

TEST_F(OAuthClientTest, StaleLockIsIgnored) {
  // Lock left behind by a process that no longer exists
  auto probe = std::make_shared<FakeProcessProbe>(std::set<uint32_t>{});
  LockfileRecord record{4242, 9001, clock::now(), hash_server_url(kServer)};
  ASSERT_TRUE(write_json_file(lockfile(), record.to_json()).ok());

  auto client = make_client(builder(), probe);

  auto token = client->get_access_token();

  ASSERT_TRUE(token.ok());
  EXPECT_EQ(browser_->urls().size(), 1u);
  EXPECT_FALSE(fs::exists(lockfile()));
}

TEST_F(OAuthClientTest, DiscoveryFallback) {
  http_->respond("GET", kServer + "/.well-known/oauth-authorization-server", 404, "not found");
  http_->on("POST", kServer + "/oauth/register", [](const test_util::RecordedRequest&) {
    return test_util::json_response(201, {{"client_id", "fallback-client"}});
  });
  http_->on("POST", kServer + "/oauth/token", [](const test_util::RecordedRequest&) {
    return test_util::json_response(200, {{"access_token", "fallback-token"}, {"expires_in", 3600}});
  });
  auto client = make_client(builder());

  auto token = client->get_access_token();

  ASSERT_TRUE(token.ok()) << token.error->to_string();
  EXPECT_EQ(*token.value, "fallback-token");
  ASSERT_EQ(browser_->urls().size(), 1u);
  EXPECT_EQ(browser_->urls()[0].rfind(kServer + "/oauth/authorize?", 0), 0u);
}

TEST_F(OAuthClientTest, NoWayToGetClientCredentials) {
  http_->on("GET", kServer + "/.well-known/oauth-authorization-server", [](const test_util::RecordedRequest&) {
    return test_util::json_response(200, metadata_doc(false));
  });
  auto client = make_client(builder());

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::InvalidConfiguration);
  EXPECT_TRUE(browser_->urls().empty());
}

TEST_F(OAuthClientTest, RegistrationRejected) {
  http_->respond("POST", kServer + "/register", 400, R"({"error":"invalid_redirect_uri"})");
  auto client = make_client(builder());

  auto token = client->get_access_token();

  ASSERT_TRUE(token.failed());
  EXPECT_EQ(token.error->kind, ErrorKind::ClientRegistration);
  EXPECT_EQ(token.error->status_code, 400);
}

TEST_F(OAuthClientTest, ClearTokens) {
  store_token("cached", std::chrono::seconds(3600), std::nullopt);
  auto client = make_client(builder());
  EXPECT_TRUE(client->has_stored_token());

  ASSERT_TRUE(client->clear_tokens().ok());
  EXPECT_FALSE(client->has_stored_token());
  EXPECT_EQ(client->state(), AuthState::NoToken);

  // Nothing left to clear is fine
  EXPECT_TRUE(client->clear_tokens().ok());
}

TEST_F(OAuthClientTest, AuthorizationUrlWithExistingQueryAndScope) {
  auto b = builder();
  b.with_scope("read write");
  auto client = make_client(b);

  ServerMetadata metadata = static_metadata();
  metadata.authorization_endpoint = kServer + "/authorize?tenant=acme";

  AuthorizationSession session;
  session.state = "st";
  session.pkce = PkceChallenge::generate();
  session.redirect_uri = "http://localhost:3334/callback";

  auto url = client->build_authorization_url(metadata, "cid", session);

  EXPECT_EQ(url.rfind(kServer + "/authorize?tenant=acme&response_type=code&", 0), 0u);
  EXPECT_NE(url.find("redirect_uri=http%3A%2F%2Flocalhost%3A3334%2Fcallback"), std::string::npos);
  EXPECT_NE(url.find("scope=read%20write"), std::string::npos);

  auto params = query_of(url);
  EXPECT_EQ(params["tenant"], "acme");
  EXPECT_EQ(params["client_id"], "cid");
  EXPECT_EQ(params["state"], "st");
  EXPECT_EQ(params["code_challenge"], session.pkce.code_challenge);
}

TEST(AuthStateTest, Names) {
  EXPECT_EQ(to_string(AuthState::NoToken), "no_token");
  EXPECT_EQ(to_string(AuthState::AwaitingAuthorization), "awaiting_authorization");
  EXPECT_EQ(to_string(AuthState::Valid), "valid");
  EXPECT_EQ(to_string(AuthState::Failed), "failed");
}
