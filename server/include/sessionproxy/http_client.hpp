/*
 * 설명: 업스트림 호출에 쓰는 동기 HTTP/HTTPS 클라이언트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/account_api_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http/verb.hpp>

namespace sessionproxy {

class HttpClientError : public std::runtime_error {
 public:
  explicit HttpClientError(const std::string& message) : std::runtime_error(message) {}
};

struct HttpRequestSpec {
  boost::beast::http::verb method{boost::beast::http::verb::get};
  bool use_tls{false};
  std::string host;
  unsigned short port{80};
  std::string target{"/"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  // 설정되면 host 이름을 풀지 않고 이 주소로 바로 접속한다. Host 헤더와 SNI는 host 그대로 둔다.
  std::optional<std::string> connect_address;
  bool verify_peer{true};
};

struct HttpResult {
  unsigned status{0};
  std::string body;
};

struct ParsedUrl {
  bool use_tls{false};
  std::string host;
  unsigned short port{80};
  std::string target{"/"};
};

// http(s)://host[:port][/path] 만 지원한다. 형식이 잘못되면 std::invalid_argument.
ParsedUrl ParseUrl(const std::string& url);

class HttpClient {
 public:
  explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  // 전송 단계 실패(이름 풀이, 접속, TLS, 읽기/쓰기, 타임아웃)는 HttpClientError로 던진다.
  HttpResult Send(const HttpRequestSpec& spec) const;

 private:
  std::chrono::milliseconds timeout_;
};

}  // namespace sessionproxy
