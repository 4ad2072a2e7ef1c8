/*
 * 설명: DNS 재지정을 우회해 실제 인증 서버(세션 서버)에 요청을 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/authority_connector_test.cpp, server/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/beast/http/verb.hpp>

#include "sessionproxy/http_client.hpp"
#include "sessionproxy/trusted_resolver.hpp"

namespace sessionproxy {

class UpstreamError : public std::runtime_error {
 public:
  explicit UpstreamError(const std::string& message) : std::runtime_error(message) {}
};

struct UpstreamResponse {
  unsigned status{0};
  std::string body;
};

class UpstreamConnector {
 public:
  virtual ~UpstreamConnector() = default;

  // path_and_query는 /session/minecraft/ 아래 상대 경로다. 예: "join", "profile/<id>?unsigned=false".
  virtual UpstreamResponse Request(boost::beast::http::verb method, const std::string& path_and_query,
                                   const std::optional<std::string>& body) = 0;
};

// 매 요청마다 신뢰 리졸버로 IP를 구해 그 IP에 TLS로 접속하고, Host/SNI는 원래 호스트 이름으로 보낸다.
// IP로 접속하므로 인증서 검증은 끈다. 이 우회는 고정된 세션 서버 호스트 하나에만 쓴다.
class AuthorityConnector : public UpstreamConnector {
 public:
  static constexpr unsigned short kHttpsPort = 443;

  AuthorityConnector(std::string authority_host, std::shared_ptr<TrustedResolver> resolver,
                     std::shared_ptr<HttpClient> client, unsigned short port = kHttpsPort);

  UpstreamResponse Request(boost::beast::http::verb method, const std::string& path_and_query,
                           const std::optional<std::string>& body) override;

 private:
  std::string authority_host_;
  std::shared_ptr<TrustedResolver> resolver_;
  std::shared_ptr<HttpClient> client_;
  unsigned short port_;
};

}  // namespace sessionproxy
