#include <gtest/gtest.h>

#include "sessionproxy/api_response.hpp"
#include "sessionproxy/http_client.hpp"
#include "sessionproxy/observability.hpp"

TEST(ApiResponseTest, ErrorBodyShape) {
  auto body = sessionproxy::MakeErrorBody("ForbiddenOperationException", "Invalid credentials.");
  EXPECT_EQ(body["error"], "ForbiddenOperationException");
  EXPECT_EQ(body["errorMessage"], "Invalid credentials.");
  EXPECT_EQ(body.size(), 2u);
}

TEST(ApiResponseTest, UrlEncodeKeepsUnreservedCharacters) {
  EXPECT_EQ(sessionproxy::UrlEncode("abc-DEF_1.2~"), "abc-DEF_1.2~");
  EXPECT_EQ(sessionproxy::UrlEncode("a b&c=d/"), "a%20b%26c%3Dd%2F");
  EXPECT_EQ(sessionproxy::UrlDecode("a%20b%26c%3Dd%2F"), "a b&c=d/");
  EXPECT_EQ(sessionproxy::UrlDecode("a+b"), "a b");
  EXPECT_EQ(sessionproxy::UrlDecode("100%"), "100%");
  EXPECT_EQ(sessionproxy::UrlDecode("%zz"), "%zz");
}

TEST(ApiResponseTest, QueryParamsAreDecoded) {
  auto params = sessionproxy::ParseQueryParams("username=Alice&serverId=-1a%2Bb&empty=&novalue");
  EXPECT_EQ(params["username"], "Alice");
  EXPECT_EQ(params["serverId"], "-1a+b");
  EXPECT_EQ(params["empty"], "");
  EXPECT_EQ(params.count("novalue"), 0u);
}

TEST(ApiResponseTest, LowerCasesAscii) { EXPECT_EQ(sessionproxy::ToLower("NotCH_01"), "notch_01"); }

TEST(ApiResponseTest, RejectsMalformedUtf8) {
  EXPECT_TRUE(sessionproxy::IsValidUtf8("Notch"));
  EXPECT_TRUE(sessionproxy::IsValidUtf8("\xEC\x84\xB8\xEC\x85\x98"));
  EXPECT_TRUE(sessionproxy::IsValidUtf8("\xF0\x9F\x8E\xAE"));
  EXPECT_FALSE(sessionproxy::IsValidUtf8("\xFF"));
  EXPECT_FALSE(sessionproxy::IsValidUtf8("ab\xC3"));
  EXPECT_FALSE(sessionproxy::IsValidUtf8("\xC0\xAF"));
  EXPECT_FALSE(sessionproxy::IsValidUtf8("\xED\xA0\x80"));
  EXPECT_FALSE(sessionproxy::IsValidUtf8("\xF4\x90\x80\x80"));
}

TEST(ObservabilityTest, LogSurvivesInvalidUtf8) {
  sessionproxy::Observability observability;
  sessionproxy::LogContext ctx{"trace-1", "has_joined"};
  ctx.username = std::string("\xFF");
  testing::internal::CaptureStdout();
  EXPECT_NO_THROW(observability.Log(ctx));
  auto line = testing::internal::GetCapturedStdout();
  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["username"], "\xEF\xBF\xBD");
}

TEST(HttpClientTest, ParsesUrls) {
  auto https = sessionproxy::ParseUrl("https://accounts.example.com/api/lookup?x=1");
  EXPECT_TRUE(https.use_tls);
  EXPECT_EQ(https.host, "accounts.example.com");
  EXPECT_EQ(https.port, 443);
  EXPECT_EQ(https.target, "/api/lookup?x=1");

  auto plain = sessionproxy::ParseUrl("http://127.0.0.1:8081");
  EXPECT_FALSE(plain.use_tls);
  EXPECT_EQ(plain.host, "127.0.0.1");
  EXPECT_EQ(plain.port, 8081);
  EXPECT_EQ(plain.target, "/");

  EXPECT_THROW(sessionproxy::ParseUrl("ftp://example.com"), std::invalid_argument);
  EXPECT_THROW(sessionproxy::ParseUrl("http://example.com:99999/"), std::invalid_argument);
  EXPECT_THROW(sessionproxy::ParseUrl("http:///path"), std::invalid_argument);
}
