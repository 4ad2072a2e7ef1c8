/*
 * 설명: 로컬 자격 증명을 프로필 이름으로 바꾸는 계정 백엔드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/account_resolver_test.cpp, server/tests/e2e/account_api_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "sessionproxy/http_client.hpp"

namespace sessionproxy {

class AccountResolver {
 public:
  virtual ~AccountResolver() = default;
  virtual std::optional<std::string> Resolve(const std::string& credential) const = 0;
};

class StaticAccountResolver : public AccountResolver {
 public:
  explicit StaticAccountResolver(std::unordered_map<std::string, std::string> accounts);

  // 파일이 없거나 JSON 객체(문자열 -> 문자열)가 아니면 std::runtime_error.
  static std::shared_ptr<StaticAccountResolver> LoadFromFile(const std::string& path);

  std::optional<std::string> Resolve(const std::string& credential) const override;
  std::size_t Size() const { return accounts_.size(); }

 private:
  const std::unordered_map<std::string, std::string> accounts_;
};

class RemoteAccountResolver : public AccountResolver {
 public:
  RemoteAccountResolver(const std::string& endpoint, std::optional<std::string> secret,
                        std::shared_ptr<HttpClient> client);

  // 전송 실패, 2xx 외 상태, 잘못된 본문은 모두 "없음"으로 취급한다.
  std::optional<std::string> Resolve(const std::string& credential) const override;

 private:
  ParsedUrl endpoint_;
  std::optional<std::string> secret_;
  std::shared_ptr<HttpClient> client_;
};

}  // namespace sessionproxy
