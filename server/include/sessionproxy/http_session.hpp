/*
 * 설명: HTTP 연결을 처리하고 join/hasJoined 및 운영 엔드포인트를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "sessionproxy/handshake_service.hpp"
#include "sessionproxy/observability.hpp"
#include "sessionproxy/session_store.hpp"

namespace sessionproxy {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, boost::asio::thread_pool& handshake_pool,
              std::shared_ptr<HandshakeService> handshake_service, std::shared_ptr<SessionStore> store,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleJoin();
  void HandleHasJoined(const std::string& query);
  void RunHandshake(std::function<HandshakeResult()> work, std::string username, std::string server_id);
  void SendError(boost::beast::http::status status, std::string_view error, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res, const LogContext& log_ctx);
  std::shared_ptr<Response> MakeResponse(unsigned status, std::string body) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  boost::asio::thread_pool& handshake_pool_;
  std::shared_ptr<HandshakeService> handshake_service_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace sessionproxy
