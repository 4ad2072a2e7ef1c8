/*
 * 설명: 정적 계정 테이블과 원격 계정 조회 백엔드를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/account_resolver_test.cpp, server/tests/e2e/account_api_test.cpp
 */
#include "sessionproxy/account_resolver.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "sessionproxy/api_response.hpp"

namespace sessionproxy {

StaticAccountResolver::StaticAccountResolver(std::unordered_map<std::string, std::string> accounts)
    : accounts_(std::move(accounts)) {}

std::shared_ptr<StaticAccountResolver> StaticAccountResolver::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("계정 파일을 열 수 없습니다: " + path);
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("계정 파일 JSON 해석 실패: " + path + " (" + ex.what() + ")");
  }
  if (!doc.is_object()) {
    throw std::runtime_error("계정 파일 최상위는 객체여야 합니다: " + path);
  }
  std::unordered_map<std::string, std::string> accounts;
  for (const auto& item : doc.items()) {
    if (!item.value().is_string()) {
      throw std::runtime_error("계정 파일 값은 문자열이어야 합니다: " + item.key());
    }
    accounts.emplace(item.key(), item.value().get<std::string>());
  }
  return std::make_shared<StaticAccountResolver>(std::move(accounts));
}

std::optional<std::string> StaticAccountResolver::Resolve(const std::string& credential) const {
  auto it = accounts_.find(credential);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

RemoteAccountResolver::RemoteAccountResolver(const std::string& endpoint, std::optional<std::string> secret,
                                             std::shared_ptr<HttpClient> client)
    : endpoint_(ParseUrl(endpoint)), secret_(std::move(secret)), client_(std::move(client)) {}

std::optional<std::string> RemoteAccountResolver::Resolve(const std::string& credential) const {
  HttpRequestSpec spec;
  spec.method = boost::beast::http::verb::get;
  spec.use_tls = endpoint_.use_tls;
  spec.host = endpoint_.host;
  spec.port = endpoint_.port;
  const char sep = endpoint_.target.find('?') == std::string::npos ? '?' : '&';
  spec.target = endpoint_.target + sep + "token=" + UrlEncode(credential);
  if (secret_) {
    spec.headers.emplace_back("Authorization", "Bearer " + *secret_);
  }

  HttpResult result;
  try {
    result = client_->Send(spec);
  } catch (const HttpClientError&) {
    return std::nullopt;
  }
  if (result.status < 200 || result.status >= 300) {
    return std::nullopt;
  }
  try {
    auto body = nlohmann::json::parse(result.body);
    if (!body.is_object() || !body.contains("username") || !body["username"].is_string()) {
      return std::nullopt;
    }
    return body["username"].get<std::string>();
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace sessionproxy
