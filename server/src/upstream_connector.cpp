/*
 * 설명: 신뢰 리졸버로 찾은 IP에 Host 헤더를 원래 이름으로 붙여 세션 서버를 호출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/authority_connector_test.cpp
 */
#include "sessionproxy/upstream_connector.hpp"

namespace sessionproxy {
namespace {
constexpr const char* kSessionApiPrefix = "/session/minecraft/";
}  // namespace

AuthorityConnector::AuthorityConnector(std::string authority_host, std::shared_ptr<TrustedResolver> resolver,
                                       std::shared_ptr<HttpClient> client, unsigned short port)
    : authority_host_(std::move(authority_host)),
      resolver_(std::move(resolver)),
      client_(std::move(client)),
      port_(port) {}

UpstreamResponse AuthorityConnector::Request(boost::beast::http::verb method, const std::string& path_and_query,
                                             const std::optional<std::string>& body) {
  HttpRequestSpec spec;
  spec.method = method;
  spec.use_tls = true;
  spec.host = authority_host_;
  spec.port = port_;
  spec.target = std::string(kSessionApiPrefix) + path_and_query;
  // 호스트 이름으로 접속하면 재지정된 DNS 때문에 이 프록시로 되돌아온다.
  // IP로 접속하면 인증서 이름이 맞지 않으므로 검증을 끄고 Host/SNI만 원래 이름으로 둔다.
  spec.verify_peer = false;
  spec.headers.emplace_back("Host", authority_host_);
  if (body) {
    spec.body = *body;
    spec.headers.emplace_back("Content-Type", "application/json");
  }

  try {
    spec.connect_address = resolver_->ResolveFirst(authority_host_).to_string();
    auto result = client_->Send(spec);
    return UpstreamResponse{result.status, std::move(result.body)};
  } catch (const DnsError& ex) {
    throw UpstreamError("세션 서버 주소 조회 실패: " + std::string(ex.what()));
  } catch (const HttpClientError& ex) {
    throw UpstreamError("세션 서버 호출 실패: " + std::string(ex.what()));
  }
}

}  // namespace sessionproxy
