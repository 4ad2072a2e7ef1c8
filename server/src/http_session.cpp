/*
 * 설명: HTTP 요청을 해석해 join/hasJoined 핸드셰이크를 작업 풀에서 실행하고 응답을 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/handshake_flow_test.cpp
 */
#include "sessionproxy/http_session.hpp"

#include <chrono>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "sessionproxy/api_response.hpp"

namespace sessionproxy {

namespace {
constexpr const char* kJoinPath = "/session/minecraft/join";
constexpr const char* kHasJoinedPath = "/session/minecraft/hasJoined";
constexpr const char* kServerName = "sessionproxy";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, boost::asio::thread_pool& handshake_pool,
                         std::shared_ptr<HandshakeService> handshake_service, std::shared_ptr<SessionStore> store,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), handshake_pool_(handshake_pool), handshake_service_(std::move(handshake_service)),
      store_(std::move(store)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  // 핸드셰이크가 작업 풀에서 도는 동안 읽기 타임아웃이 연결을 끊지 않게 한다.
  stream_.expires_never();
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (path == kJoinPath) {
    if (req_.method() != http::verb::post) {
      return SendError(http::status::method_not_allowed, "Method Not Allowed", "join은 POST만 허용합니다");
    }
    return HandleJoin();
  }

  if (path == kHasJoinedPath) {
    if (req_.method() != http::verb::get) {
      return SendError(http::status::method_not_allowed, "Method Not Allowed", "hasJoined는 GET만 허용합니다");
    }
    return HandleHasJoined(query);
  }

  if (req_.method() == http::verb::get && path == "/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendResponse(MakeResponse(200, payload.dump()), LogContext{trace_id_, path});
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(store_->SessionCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"join", {{"local", snapshot.local_joins}, {"forwarded", snapshot.forwarded_joins}}},
                        {"hasJoined",
                         {{"local", snapshot.local_has_joined}, {"forwarded", snapshot.forwarded_has_joined}}},
                        {"upstream", {{"failures", snapshot.upstream_failures}}},
                        {"sessions", snapshot.sessions}};
    return SendResponse(MakeResponse(200, data.dump()), LogContext{trace_id_, path});
  }

  SendError(http::status::not_found, "Not Found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleJoin() {
  JoinRequest request;
  try {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.is_object() || !body_json.contains("selectedProfile") || !body_json.contains("serverId") ||
        !body_json["selectedProfile"].is_string() || !body_json["serverId"].is_string()) {
      throw std::runtime_error("invalid body");
    }
    request.selected_profile = body_json["selectedProfile"].get<std::string>();
    request.server_id = body_json["serverId"].get<std::string>();
    if (body_json.contains("authString") && !body_json["authString"].is_null()) {
      if (!body_json["authString"].is_string()) {
        throw std::runtime_error("invalid authString");
      }
      request.auth_string = body_json["authString"].get<std::string>();
    }
  } catch (const std::exception&) {
    return SendError(boost::beast::http::status::bad_request, "Bad Request", "JSON 본문이 올바르지 않습니다");
  }

  auto service = handshake_service_;
  std::string raw_body = req_.body();
  auto username = request.selected_profile;
  auto server_id = request.server_id;
  RunHandshake([service, request = std::move(request), raw_body = std::move(raw_body)]() {
    return service->Join(request, raw_body);
  }, std::move(username), std::move(server_id));
}

void HttpSession::HandleHasJoined(const std::string& query) {
  auto params = ParseQueryParams(query);
  auto username_it = params.find("username");
  auto server_it = params.find("serverId");
  if (username_it == params.end() || server_it == params.end()) {
    return SendError(boost::beast::http::status::bad_request, "Bad Request", "username과 serverId가 필요합니다");
  }
  if (!IsValidUtf8(username_it->second) || !IsValidUtf8(server_it->second)) {
    return SendError(boost::beast::http::status::bad_request, "Bad Request", "username과 serverId는 UTF-8이어야 합니다");
  }

  auto service = handshake_service_;
  auto username = username_it->second;
  auto server_id = server_it->second;
  RunHandshake([service, username, server_id]() { return service->HasJoined(username, server_id); },
               username, server_id);
}

void HttpSession::RunHandshake(std::function<HandshakeResult()> work, std::string username,
                               std::string server_id) {
  auto self = shared_from_this();
  // 업스트림 호출은 블로킹이므로 I/O 스레드가 아닌 작업 풀에서 실행하고, 응답은 연결의 실행기로 돌려보낸다.
  boost::asio::post(handshake_pool_, [self, work = std::move(work), username = std::move(username),
                                      server_id = std::move(server_id)]() mutable {
    HandshakeResult result;
    try {
      result = work();
    } catch (const std::exception& ex) {
      result.status = 500;
      result.body = MakeErrorBody("InternalServerError", ex.what()).dump();
      result.outcome = HandshakeOutcome::kStoreFailure;
    }
    boost::asio::post(self->stream_.get_executor(),
                      [self, result = std::move(result), username = std::move(username),
                       server_id = std::move(server_id)]() {
                        LogContext ctx{self->trace_id_, ToString(result.outcome), username, server_id};
                        self->SendResponse(self->MakeResponse(result.status, result.body), ctx);
                      });
  });
}

std::shared_ptr<HttpSession::Response> HttpSession::MakeResponse(unsigned status, std::string body) const {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->keep_alive(false);
  if (!body.empty()) {
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  }
  res->body() = std::move(body);
  res->content_length(res->body().size());
  return res;
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view error, std::string_view message) {
  auto res = MakeResponse(static_cast<unsigned>(status), MakeErrorBody(error, message).dump());
  SendResponse(res, LogContext{trace_id_, std::string(req_.target())});
}

void HttpSession::SendResponse(std::shared_ptr<Response> res, const LogContext& log_ctx) {
  auto self = shared_from_this();
  if (observability_) {
    if (res->result_int() >= 400) {
      observability_->IncrementError();
    }
    LogContext ctx = log_ctx;
    ctx.status = res->result_int();
    ctx.latency_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count();
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace sessionproxy
