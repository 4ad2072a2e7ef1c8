#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "sessionproxy/account_resolver.hpp"

namespace {

std::string WriteTempFile(const std::string& name, const std::string& contents) {
  auto path = std::filesystem::temp_directory_path() /
              ("sessionproxy-accounts-" + name + "-" + std::to_string(::getpid()) + ".json");
  std::ofstream out(path);
  out << contents;
  return path.string();
}

TEST(StaticAccountResolverTest, ResolvesExactCredential) {
  sessionproxy::StaticAccountResolver resolver({{"token-1", "profile-a"}, {"token-2", "profile-b"}});
  EXPECT_EQ(resolver.Resolve("token-1").value_or(""), "profile-a");
  EXPECT_EQ(resolver.Resolve("token-2").value_or(""), "profile-b");
  EXPECT_FALSE(resolver.Resolve("TOKEN-1").has_value());
  EXPECT_FALSE(resolver.Resolve("").has_value());
}

TEST(StaticAccountResolverTest, LoadsFromJsonFile) {
  auto path = WriteTempFile("ok", R"({"secret-a": "0123abcd", "secret-b": "4567ef00"})");
  auto resolver = sessionproxy::StaticAccountResolver::LoadFromFile(path);
  ASSERT_NE(resolver, nullptr);
  EXPECT_EQ(resolver->Size(), 2u);
  EXPECT_EQ(resolver->Resolve("secret-b").value_or(""), "4567ef00");
}

TEST(StaticAccountResolverTest, LoadFailuresAreFatal) {
  EXPECT_THROW(sessionproxy::StaticAccountResolver::LoadFromFile("/nonexistent/sessionproxy/accounts.json"),
               std::runtime_error);
  EXPECT_THROW(sessionproxy::StaticAccountResolver::LoadFromFile(WriteTempFile("broken", "{\"a\":")),
               std::runtime_error);
  EXPECT_THROW(sessionproxy::StaticAccountResolver::LoadFromFile(WriteTempFile("array", "[1, 2]")),
               std::runtime_error);
  EXPECT_THROW(sessionproxy::StaticAccountResolver::LoadFromFile(WriteTempFile("number", R"({"a": 1})")),
               std::runtime_error);
}

}  // namespace
