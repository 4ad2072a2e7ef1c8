/*
 * 설명: 프록시 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace sessionproxy {

enum class AccountBackend { kFile, kApi };

struct AppConfig {
  std::string bind_host{"0.0.0.0"};
  unsigned short bind_port{3000};
  AccountBackend account_backend{AccountBackend::kFile};
  std::string accounts_file{"accounts.json"};
  std::string account_endpoint;
  std::string account_secret;
  std::string sessions_file{"sessions.json"};
  std::string upstream_host{"sessionserver.mojang.com"};
  std::string trusted_dns{"1.1.1.1"};
  std::size_t upstream_timeout_ms{5000};
  std::size_t handshake_threads{4};
};

// "host:port" 형식을 분리한다. 형식이 잘못되면 std::invalid_argument.
void ParseBindAddress(const std::string& value, std::string& host, unsigned short& port);

AppConfig LoadConfigFromEnv();

}  // namespace sessionproxy
