#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

#include "core/config.hpp"
#include "oauth/oauth_config.hpp"
#include "test_helpers.hpp"

using namespace mcp_remote;

namespace fs = std::filesystem;

namespace {

const char* kEnvVars[] = {"MCP_REMOTE_AUTH_DIR",      "MCP_REMOTE_CLIENT_ID",    "MCP_REMOTE_CLIENT_SECRET", "MCP_REMOTE_CALLBACK_HOST",
                          "MCP_REMOTE_CALLBACK_PORT", "MCP_REMOTE_AUTH_TIMEOUT", "MCP_REMOTE_SCOPE",         "MCP_REMOTE_LOG_LEVEL"};

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = test_util::make_temp_dir("mcp_remote_config");
    const char* home = std::getenv("HOME");
    if (home) saved_home_ = home;
    setenv("HOME", test_dir_.c_str(), 1);
    for (const char* name : kEnvVars) unsetenv(name);
  }

  void TearDown() override {
    if (saved_home_) {
      setenv("HOME", saved_home_->c_str(), 1);
    } else {
      unsetenv("HOME");
    }
    for (const char* name : kEnvVars) unsetenv(name);
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
  std::optional<std::string> saved_home_;
};

TEST_F(ConfigTest, Defaults) {
  Config config = Config::load_default();

  EXPECT_EQ(config.callback_host, "localhost");
  EXPECT_EQ(config.auth_timeout_secs, 300u);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.client_id.has_value());
  EXPECT_EQ(config.resolved_auth_dir(), test_dir_ / ".mcp-auth");
}

TEST_F(ConfigTest, SaveAndLoad) {
  Config config;
  config.client_id = "client-1";
  config.client_secret = "secret";
  config.callback_port = 8765;
  config.auth_timeout_secs = 120;
  config.scope = "mcp";
  config.log_level = "debug";

  auto path = config_paths::default_config_file();
  ASSERT_TRUE(config.save(path).ok());

  auto loaded = Config::load_default();
  EXPECT_EQ(loaded.client_id, "client-1");
  EXPECT_EQ(loaded.client_secret, "secret");
  EXPECT_EQ(loaded.callback_port, 8765);
  EXPECT_EQ(loaded.auth_timeout_secs, 120u);
  EXPECT_EQ(loaded.scope, "mcp");
  EXPECT_EQ(loaded.log_level, "debug");

#ifndef _WIN32
  auto perms = fs::status(path).permissions();
  EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
#endif
}

TEST_F(ConfigTest, MalformedFileGivesDefaults) {
  auto path = config_paths::default_config_file();
  fs::create_directories(path.parent_path());
  std::ofstream(path) << "{ not json";

  auto config = Config::load(path);
  EXPECT_EQ(config.callback_host, "localhost");
  EXPECT_FALSE(config.client_id.has_value());
}

TEST_F(ConfigTest, FromEnvOverridesFile) {
  Config file_config;
  file_config.client_id = "from-file";
  file_config.scope = "file-scope";
  ASSERT_TRUE(file_config.save(config_paths::default_config_file()).ok());

  setenv("MCP_REMOTE_CLIENT_ID", "from-env", 1);
  setenv("MCP_REMOTE_CALLBACK_PORT", "9000", 1);
  setenv("MCP_REMOTE_AUTH_TIMEOUT", "45", 1);
  setenv("MCP_REMOTE_AUTH_DIR", (test_dir_ / "auth").c_str(), 1);

  auto config = Config::from_env();
  EXPECT_EQ(config.client_id, "from-env");
  EXPECT_EQ(config.scope, "file-scope");
  EXPECT_EQ(config.callback_port, 9000);
  EXPECT_EQ(config.auth_timeout_secs, 45u);
  EXPECT_EQ(config.resolved_auth_dir(), test_dir_ / "auth");
}

TEST_F(ConfigTest, InvalidEnvNumbersIgnored) {
  setenv("MCP_REMOTE_CALLBACK_PORT", "70000", 1);
  setenv("MCP_REMOTE_AUTH_TIMEOUT", "soon", 1);

  auto config = Config::from_env();
  EXPECT_FALSE(config.callback_port.has_value());
  EXPECT_EQ(config.auth_timeout_secs, 300u);
}

TEST_F(ConfigTest, ToOAuthConfig) {
  Config config;
  config.client_id = "static-client";
  config.callback_port = 7777;
  config.scope = "mcp";

  auto oauth_config = config.to_oauth_config("https://mcp.example.com");
  ASSERT_TRUE(oauth_config.ok());
  EXPECT_EQ(oauth_config.value->server_url, "https://mcp.example.com");
  ASSERT_TRUE(oauth_config.value->static_client_info.has_value());
  EXPECT_EQ(oauth_config.value->static_client_info->client_id, "static-client");
  EXPECT_EQ(oauth_config.value->callback_port, 7777);
  EXPECT_EQ(oauth_config.value->auth_dir, test_dir_ / ".mcp-auth");

  auto invalid = config.to_oauth_config("ftp://mcp.example.com");
  ASSERT_TRUE(invalid.failed());
  EXPECT_EQ(invalid.error->kind, ErrorKind::InvalidConfiguration);
}

// --- OAuthConfigBuilderTest ---

TEST(OAuthConfigBuilderTest, DefaultsAreValid) {
  auto config = oauth::OAuthConfigBuilder("https://mcp.example.com").with_auth_dir("/tmp/mcp-auth-test").build();

  ASSERT_TRUE(config.ok());
  EXPECT_EQ(config.value->callback_host, "localhost");
  EXPECT_EQ(config.value->auth_timeout_secs, 300u);
  EXPECT_FALSE(config.value->callback_port.has_value());
  EXPECT_EQ(config.value->coordination.max_lock_age, std::chrono::minutes(30));
}

TEST(OAuthConfigBuilderTest, ValidationFailures) {
  auto expect_invalid = [](const Result<oauth::OAuthConfig>& result) {
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidConfiguration);
  };

  expect_invalid(oauth::OAuthConfigBuilder("").build());
  expect_invalid(oauth::OAuthConfigBuilder("mcp.example.com").build());
  expect_invalid(oauth::OAuthConfigBuilder("https://").build());
  expect_invalid(oauth::OAuthConfigBuilder("https://mcp.example.com").with_callback_host("").build());
  expect_invalid(oauth::OAuthConfigBuilder("https://mcp.example.com").with_auth_timeout(0).build());
  expect_invalid(oauth::OAuthConfigBuilder("https://mcp.example.com").with_auth_timeout(oauth::kMaxAuthTimeoutSecs + 1).build());
  expect_invalid(oauth::OAuthConfigBuilder("https://mcp.example.com").with_auth_timeout(std::numeric_limits<uint64_t>::max()).build());
  EXPECT_TRUE(oauth::OAuthConfigBuilder("https://mcp.example.com").with_auth_timeout(oauth::kMaxAuthTimeoutSecs).build().ok());
  expect_invalid(oauth::OAuthConfigBuilder("https://mcp.example.com").with_static_client_info({"", std::nullopt}).build());
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, AuthDirUnderHome) {
  EXPECT_EQ(config_paths::auth_dir(), config_paths::home_dir() / ".mcp-auth");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
}
