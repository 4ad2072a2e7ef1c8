/*
 * 설명: join / hasJoined 핸드셰이크를 계정 백엔드, 업스트림, 세션 저장소로 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/handshake_service_test.cpp, server/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "sessionproxy/account_resolver.hpp"
#include "sessionproxy/observability.hpp"
#include "sessionproxy/session_store.hpp"
#include "sessionproxy/upstream_connector.hpp"

namespace sessionproxy {

struct JoinRequest {
  std::string selected_profile;
  std::string server_id;
  std::optional<std::string> auth_string;
};

enum class HandshakeOutcome {
  kLocalJoin,
  kForwarded,
  kUnauthorized,
  kUpstreamUnavailable,
  kLocalProfile,
  kStoreFailure,
};

struct HandshakeResult {
  unsigned status{0};
  std::string body;
  HandshakeOutcome outcome{HandshakeOutcome::kForwarded};
};

class HandshakeService {
 public:
  using Clock = std::function<std::int64_t()>;

  HandshakeService(std::shared_ptr<AccountResolver> accounts, std::shared_ptr<UpstreamConnector> upstream,
                   std::shared_ptr<SessionStore> store, std::shared_ptr<Observability> observability,
                   Clock clock = SystemClock);

  // raw_body는 authString이 없을 때 그대로 업스트림에 전달된다.
  HandshakeResult Join(const JoinRequest& request, const std::string& raw_body);
  HandshakeResult HasJoined(const std::string& username, const std::string& server_id);

  static std::int64_t SystemClock();

 private:
  HandshakeResult JoinWithCredential(const JoinRequest& request);
  HandshakeResult UpstreamFailure(const std::string& step, const std::exception& ex);

  std::shared_ptr<AccountResolver> accounts_;
  std::shared_ptr<UpstreamConnector> upstream_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
};

const char* ToString(HandshakeOutcome outcome);

}  // namespace sessionproxy
