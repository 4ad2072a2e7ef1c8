/*
 * 설명: 프록시 전체 수명주기와 구성 요소 연결을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "sessionproxy/account_resolver.hpp"
#include "sessionproxy/config.hpp"
#include "sessionproxy/handshake_service.hpp"
#include "sessionproxy/observability.hpp"
#include "sessionproxy/session_store.hpp"
#include "sessionproxy/upstream_connector.hpp"

namespace sessionproxy {

class Listener;

class ProxyApp {
 public:
  // 설정으로 계정 백엔드와 업스트림 커넥터를 만든다. 계정 파일 오류 등은 예외로 전달된다.
  explicit ProxyApp(const AppConfig& config);
  // 테스트에서 계정 백엔드와 업스트림을 바꿔 끼울 때 쓴다.
  ProxyApp(const AppConfig& config, std::shared_ptr<AccountResolver> accounts,
           std::shared_ptr<UpstreamConnector> upstream);
  ~ProxyApp();

  // 리스너를 열고 워커를 띄운다. 바인드 실패는 예외로 전달된다.
  void Start();
  // Start 후 현재 스레드에서 이벤트 루프를 돌린다.
  void Run();
  void Stop();

  unsigned short BoundPort() const;
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionStore> GetSessionStore() { return store_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Wire(std::shared_ptr<AccountResolver> accounts, std::shared_ptr<UpstreamConnector> upstream);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool handshake_pool_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<HandshakeService> handshake_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

std::shared_ptr<AccountResolver> BuildAccountResolver(const AppConfig& config, std::shared_ptr<HttpClient> client);

}  // namespace sessionproxy
