/*
 * 설명: join 기록 테이블의 만료 정리, 조회, 파일 저장/복원을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_store_test.cpp
 */
#include "sessionproxy/session_store.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "sessionproxy/api_response.hpp"

namespace sessionproxy {

SessionStore::SessionStore(std::string path, std::shared_ptr<Observability> observability)
    : path_(std::move(path)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()) {}

std::size_t SessionStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.clear();
  std::ifstream in(path_);
  if (!in) {
    LogLoad("session_file_missing", std::nullopt);
    return 0;
  }
  try {
    auto doc = nlohmann::json::parse(in);
    if (!doc.is_object()) {
      throw std::runtime_error("최상위가 객체가 아님");
    }
    SessionTable loaded;
    for (const auto& item : doc.items()) {
      const auto& entry = item.value();
      JoinSession session;
      session.profile_id = entry.at("uuid").get<std::string>();
      for (const auto& server : entry.at("servers").items()) {
        session.servers[server.key()] = server.value().get<std::int64_t>();
      }
      loaded[ToLower(item.key())] = std::move(session);
    }
    sessions_ = std::move(loaded);
  } catch (const std::exception& ex) {
    LogLoad("session_file_corrupt", std::string(ex.what()));
    sessions_.clear();
    return 0;
  }
  LogLoad("session_file_loaded", std::to_string(sessions_.size()) + " sessions");
  return sessions_.size();
}

void SessionStore::RecordJoin(const std::string& username, const std::string& profile_id,
                              const std::string& server_id, std::int64_t now) {
  auto key = ToLower(username);
  std::lock_guard<std::mutex> lock(mutex_);
  // 저장에 성공한 표만 반영한다. 실패하면 메모리와 파일 모두 이전 상태로 남는다.
  auto next = sessions_;
  PruneExpired(next, now);
  auto it = next.find(key);
  if (it == next.end()) {
    it = next.emplace(key, JoinSession{profile_id, {}}).first;
  }
  it->second.servers[server_id] = now;
  Persist(next);
  sessions_ = std::move(next);
}

std::optional<std::string> SessionStore::CheckJoin(const std::string& username, const std::string& server_id,
                                                   std::int64_t now) const {
  auto key = ToLower(username);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(key);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  auto server_it = it->second.servers.find(server_id);
  if (server_it == it->second.servers.end()) {
    return std::nullopt;
  }
  if (now - server_it->second > kValiditySeconds) {
    return std::nullopt;
  }
  return it->second.profile_id;
}

std::size_t SessionStore::SessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionStore::LogLoad(const std::string& name, std::optional<std::string> detail) const {
  LogContext ctx{"session-store", name};
  ctx.detail = detail ? path_ + ": " + *detail : path_;
  observability_->Log(ctx);
}

void SessionStore::PruneExpired(SessionTable& sessions, std::int64_t now) {
  for (auto& [username, session] : sessions) {
    for (auto it = session.servers.begin(); it != session.servers.end();) {
      if (now - it->second > kValiditySeconds) {
        it = session.servers.erase(it);
      } else {
        ++it;
      }
    }
  }
}

nlohmann::json SessionStore::ToJson(const SessionTable& sessions) {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto& [username, session] : sessions) {
    nlohmann::json servers = nlohmann::json::object();
    for (const auto& [server_id, ts] : session.servers) {
      servers[server_id] = ts;
    }
    doc[username] = {{"uuid", session.profile_id}, {"servers", servers}};
  }
  return doc;
}

void SessionStore::Persist(const SessionTable& sessions) const {
  // 임시 파일에 전부 쓴 뒤 교체해 반쯤 쓰인 스냅샷이 남지 않게 한다.
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("세션 파일 열기 실패: " + tmp_path);
    }
    out << ToJson(sessions).dump();
    out.flush();
    if (!out) {
      throw std::runtime_error("세션 파일 쓰기 실패: " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("세션 파일 교체 실패: " + path_);
  }
}

}  // namespace sessionproxy
