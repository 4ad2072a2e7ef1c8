/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/handshake_flow_test.cpp, server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sessionproxy {

struct LogContext {
  std::string trace_id;
  std::string name;
  std::optional<std::string> username;
  std::optional<std::string> server_id;
  std::optional<unsigned> status;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t local_joins{0};
  std::uint64_t forwarded_joins{0};
  std::uint64_t local_has_joined{0};
  std::uint64_t forwarded_has_joined{0};
  std::uint64_t upstream_failures{0};
  std::uint64_t sessions{0};
};

class Observability {
 public:
  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementLocalJoin();
  void IncrementForwardedJoin();
  void IncrementLocalHasJoined();
  void IncrementForwardedHasJoined();
  void IncrementUpstreamFailure();
  MetricsSnapshot Snapshot(std::uint64_t sessions) const;
  void Log(const LogContext& ctx) const;

 private:
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> local_joins_{0};
  std::atomic<std::uint64_t> forwarded_joins_{0};
  std::atomic<std::uint64_t> local_has_joined_{0};
  std::atomic<std::uint64_t> forwarded_has_joined_{0};
  std::atomic<std::uint64_t> upstream_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace sessionproxy
