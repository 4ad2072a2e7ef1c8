/*
 * 설명: join / hasJoined 핸드셰이크 흐름을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/handshake_service_test.cpp, server/tests/e2e/handshake_flow_test.cpp
 */
#include "sessionproxy/handshake_service.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

#include "sessionproxy/api_response.hpp"

namespace sessionproxy {
namespace {
constexpr unsigned kNoContent = 204;
constexpr unsigned kUnauthorized = 401;
constexpr unsigned kInternalError = 500;
constexpr unsigned kServiceUnavailable = 503;

std::optional<std::string> ExtractProfileName(const std::string& body) {
  try {
    auto profile = nlohmann::json::parse(body);
    if (!profile.is_object()) {
      return std::nullopt;
    }
    auto it = profile.find("name");
    if (it == profile.end() || !it->is_string()) {
      return std::nullopt;
    }
    return it->get<std::string>();
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}
}  // namespace

const char* ToString(HandshakeOutcome outcome) {
  switch (outcome) {
    case HandshakeOutcome::kLocalJoin:
      return "local_join";
    case HandshakeOutcome::kForwarded:
      return "forwarded";
    case HandshakeOutcome::kUnauthorized:
      return "unauthorized";
    case HandshakeOutcome::kUpstreamUnavailable:
      return "upstream_unavailable";
    case HandshakeOutcome::kLocalProfile:
      return "local_profile";
    case HandshakeOutcome::kStoreFailure:
      return "store_failure";
  }
  return "unknown";
}

HandshakeService::HandshakeService(std::shared_ptr<AccountResolver> accounts,
                                   std::shared_ptr<UpstreamConnector> upstream, std::shared_ptr<SessionStore> store,
                                   std::shared_ptr<Observability> observability, Clock clock)
    : accounts_(std::move(accounts)), upstream_(std::move(upstream)), store_(std::move(store)),
      observability_(std::move(observability)), clock_(std::move(clock)) {}

std::int64_t HandshakeService::SystemClock() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

HandshakeResult HandshakeService::Join(const JoinRequest& request, const std::string& raw_body) {
  if (request.auth_string) {
    return JoinWithCredential(request);
  }

  // 자격 증명이 없으면 일반 클라이언트다. 본문을 그대로 세션 서버에 넘기고 기록은 남기지 않는다.
  try {
    auto res = upstream_->Request(boost::beast::http::verb::post, "join", raw_body);
    if (observability_) {
      observability_->IncrementForwardedJoin();
    }
    return HandshakeResult{res.status, std::move(res.body), HandshakeOutcome::kForwarded};
  } catch (const UpstreamError& ex) {
    return UpstreamFailure("join", ex);
  }
}

HandshakeResult HandshakeService::JoinWithCredential(const JoinRequest& request) {
  auto resolved = accounts_->Resolve(*request.auth_string);
  if (!resolved || *resolved != request.selected_profile) {
    auto body = MakeErrorBody("ForbiddenOperationException", "Invalid credentials.").dump();
    return HandshakeResult{kUnauthorized, body, HandshakeOutcome::kUnauthorized};
  }

  UpstreamResponse profile;
  try {
    profile = upstream_->Request(boost::beast::http::verb::get, "profile/" + UrlEncode(request.selected_profile),
                                 std::nullopt);
  } catch (const UpstreamError& ex) {
    return UpstreamFailure("profile", ex);
  }

  auto name = ExtractProfileName(profile.body);
  if (!name) {
    if (observability_) {
      observability_->IncrementUpstreamFailure();
    }
    auto body = MakeErrorBody("ServiceUnavailableException", "Profile lookup returned no name.").dump();
    return HandshakeResult{kServiceUnavailable, body, HandshakeOutcome::kUpstreamUnavailable};
  }

  try {
    store_->RecordJoin(ToLower(*name), request.selected_profile, request.server_id, clock_());
  } catch (const std::runtime_error& ex) {
    if (observability_) {
      observability_->Log(LogContext{"", "session_store_failure", *name, request.server_id, kInternalError,
                                     std::string(ex.what()), 0});
    }
    auto body = MakeErrorBody("InternalServerError", "Failed to record session.").dump();
    return HandshakeResult{kInternalError, body, HandshakeOutcome::kStoreFailure};
  }
  if (observability_) {
    observability_->IncrementLocalJoin();
  }
  return HandshakeResult{kNoContent, "", HandshakeOutcome::kLocalJoin};
}

HandshakeResult HandshakeService::HasJoined(const std::string& username, const std::string& server_id) {
  const auto lowered = ToLower(username);
  auto profile_id = store_->CheckJoin(lowered, server_id, clock_());

  try {
    if (profile_id) {
      auto res = upstream_->Request(boost::beast::http::verb::get,
                                    "profile/" + UrlEncode(*profile_id) + "?unsigned=false", std::nullopt);
      if (observability_) {
        observability_->IncrementLocalHasJoined();
      }
      return HandshakeResult{res.status, std::move(res.body), HandshakeOutcome::kLocalProfile};
    }

    auto res = upstream_->Request(boost::beast::http::verb::get,
                                  "hasJoined?serverId=" + UrlEncode(server_id) + "&username=" + UrlEncode(lowered),
                                  std::nullopt);
    if (observability_) {
      observability_->IncrementForwardedHasJoined();
    }
    return HandshakeResult{res.status, std::move(res.body), HandshakeOutcome::kForwarded};
  } catch (const UpstreamError& ex) {
    return UpstreamFailure(profile_id ? "profile" : "hasJoined", ex);
  }
}

HandshakeResult HandshakeService::UpstreamFailure(const std::string& step, const std::exception& ex) {
  if (observability_) {
    observability_->IncrementUpstreamFailure();
    observability_->Log(
        LogContext{"", "upstream_failure", std::nullopt, std::nullopt, kServiceUnavailable,
                   step + ": " + ex.what(), 0});
  }
  auto body = MakeErrorBody("ServiceUnavailableException", "Session server is unreachable.").dump();
  return HandshakeResult{kServiceUnavailable, body, HandshakeOutcome::kUpstreamUnavailable};
}

}  // namespace sessionproxy
