/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "sessionproxy/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sessionproxy {

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementLocalJoin() { local_joins_.fetch_add(1); }

void Observability::IncrementForwardedJoin() { forwarded_joins_.fetch_add(1); }

void Observability::IncrementLocalHasJoined() { local_has_joined_.fetch_add(1); }

void Observability::IncrementForwardedHasJoined() { forwarded_has_joined_.fetch_add(1); }

void Observability::IncrementUpstreamFailure() { upstream_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.local_joins = local_joins_.load();
  snapshot.forwarded_joins = forwarded_joins_.load();
  snapshot.local_has_joined = local_has_joined_.load();
  snapshot.forwarded_has_joined = forwarded_has_joined_.load();
  snapshot.upstream_failures = upstream_failures_.load();
  snapshot.sessions = sessions;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.username) {
    log_json["username"] = *ctx.username;
  }
  if (ctx.server_id) {
    log_json["serverId"] = *ctx.server_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  // 클라이언트가 보낸 값은 UTF-8이 아닐 수 있다. 잘못된 바이트는 U+FFFD로 바꿔 기록한다.
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace sessionproxy
