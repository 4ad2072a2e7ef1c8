#include <cstdlib>

#include <gtest/gtest.h>

#include "sessionproxy/config.hpp"

namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
  ~ScopedEnv() { ::unsetenv(key_); }

 private:
  const char* key_;
};

TEST(ConfigTest, ParsesBindAddress) {
  std::string host;
  unsigned short port = 0;
  sessionproxy::ParseBindAddress("0.0.0.0:3000", host, port);
  EXPECT_EQ(host, "0.0.0.0");
  EXPECT_EQ(port, 3000);

  sessionproxy::ParseBindAddress("[::1]:25585", host, port);
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 25585);

  EXPECT_THROW(sessionproxy::ParseBindAddress("3000", host, port), std::invalid_argument);
  EXPECT_THROW(sessionproxy::ParseBindAddress("host:", host, port), std::invalid_argument);
  EXPECT_THROW(sessionproxy::ParseBindAddress("host:70000", host, port), std::invalid_argument);
  EXPECT_THROW(sessionproxy::ParseBindAddress("host:abc", host, port), std::invalid_argument);
}

TEST(ConfigTest, DefaultsMatchDeployment) {
  auto cfg = sessionproxy::LoadConfigFromEnv();
  EXPECT_EQ(cfg.bind_host, "0.0.0.0");
  EXPECT_EQ(cfg.bind_port, 3000);
  EXPECT_EQ(cfg.account_backend, sessionproxy::AccountBackend::kFile);
  EXPECT_EQ(cfg.sessions_file, "sessions.json");
  EXPECT_EQ(cfg.upstream_host, "sessionserver.mojang.com");
  EXPECT_EQ(cfg.trusted_dns, "1.1.1.1");
}

TEST(ConfigTest, ReadsEnvironmentOverrides) {
  ScopedEnv bind("YGG_BIND_ADDRESS", "127.0.0.1:4000");
  ScopedEnv backend("PROXY_ACCOUNT_BACKEND", "API");
  ScopedEnv endpoint("PROXY_ACCOUNT_ENDPOINT", "https://accounts.example.com/lookup");
  ScopedEnv secret("PROXY_ACCOUNT_SECRET", "s3cret");
  ScopedEnv timeout("PROXY_UPSTREAM_TIMEOUT_MS", "1500");

  auto cfg = sessionproxy::LoadConfigFromEnv();
  EXPECT_EQ(cfg.bind_host, "127.0.0.1");
  EXPECT_EQ(cfg.bind_port, 4000);
  EXPECT_EQ(cfg.account_backend, sessionproxy::AccountBackend::kApi);
  EXPECT_EQ(cfg.account_endpoint, "https://accounts.example.com/lookup");
  EXPECT_EQ(cfg.account_secret, "s3cret");
  EXPECT_EQ(cfg.upstream_timeout_ms, 1500u);
}

TEST(ConfigTest, RejectsUnknownBackend) {
  ScopedEnv backend("PROXY_ACCOUNT_BACKEND", "ldap");
  EXPECT_THROW(sessionproxy::LoadConfigFromEnv(), std::invalid_argument);
}

}  // namespace
