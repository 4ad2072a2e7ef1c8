/*
 * 설명: 프로필별 최근 join 기록을 보관하고 변경 때마다 파일로 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "sessionproxy/observability.hpp"

namespace sessionproxy {

struct JoinSession {
  std::string profile_id;
  std::unordered_map<std::string, std::int64_t> servers;
};

class SessionStore {
 public:
  static constexpr std::int64_t kValiditySeconds = 60;

  // observability가 없으면 기본 로거로 기록한다.
  explicit SessionStore(std::string path, std::shared_ptr<Observability> observability = nullptr);

  // 파일이 없거나 해석할 수 없으면 빈 상태로 시작한다. 읽은 세션 수를 돌려준다.
  std::size_t Load();

  // 만료 항목 정리, 세션 조회/생성, 기록, 저장까지 한 번의 잠금 안에서 수행한다.
  // 저장 실패는 std::runtime_error로 전달되고 메모리 상태는 바뀌지 않는다.
  void RecordJoin(const std::string& username, const std::string& profile_id, const std::string& server_id,
                  std::int64_t now);

  std::optional<std::string> CheckJoin(const std::string& username, const std::string& server_id,
                                       std::int64_t now) const;

  std::size_t SessionCount() const;
  const std::string& Path() const { return path_; }

 private:
  using SessionTable = std::unordered_map<std::string, JoinSession>;

  static void PruneExpired(SessionTable& sessions, std::int64_t now);
  static nlohmann::json ToJson(const SessionTable& sessions);
  void Persist(const SessionTable& sessions) const;

  void LogLoad(const std::string& name, std::optional<std::string> detail) const;

  std::string path_;
  std::shared_ptr<Observability> observability_;
  SessionTable sessions_;
  mutable std::mutex mutex_;
};

}  // namespace sessionproxy
