/*
 * 설명: Beast 기반 동기 HTTP/HTTPS 클라이언트를 구현한다. 단계마다 남은 시간 안에서만 대기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/account_api_test.cpp, server/tests/unit/api_response_test.cpp
 */
#include "sessionproxy/http_client.hpp"

#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace sessionproxy {
namespace {
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// 비동기 작업 하나를 시작하고 완료될 때까지 io_context를 돌린다.
template <typename Start>
void RunStep(boost::asio::io_context& ioc, const char* stage, Start&& start) {
  beast::error_code result;
  start([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  if (result) {
    throw HttpClientError(std::string(stage) + " 실패: " + result.message());
  }
}

std::vector<tcp::endpoint> ResolveEndpoints(boost::asio::io_context& ioc, const HttpRequestSpec& spec,
                                            std::chrono::steady_clock::time_point deadline) {
  if (spec.connect_address) {
    beast::error_code ec;
    auto address = boost::asio::ip::make_address(*spec.connect_address, ec);
    if (ec) {
      throw HttpClientError("접속 주소가 올바르지 않습니다: " + *spec.connect_address);
    }
    return {tcp::endpoint{address, spec.port}};
  }

  tcp::resolver resolver{ioc};
  boost::asio::steady_timer timer{ioc};
  std::vector<tcp::endpoint> endpoints;
  beast::error_code result;
  timer.expires_at(deadline);
  timer.async_wait([&resolver](beast::error_code ec) {
    if (!ec) {
      resolver.cancel();
    }
  });
  resolver.async_resolve(spec.host, std::to_string(spec.port),
                         [&](beast::error_code ec, tcp::resolver::results_type results) {
                           timer.cancel();
                           result = ec;
                           for (const auto& entry : results) {
                             endpoints.push_back(entry.endpoint());
                           }
                         });
  ioc.restart();
  ioc.run();
  if (result) {
    throw HttpClientError("이름 풀이 실패(" + spec.host + "): " + result.message());
  }
  if (endpoints.empty()) {
    throw HttpClientError("이름 풀이 결과 없음: " + spec.host);
  }
  return endpoints;
}

http::request<http::string_body> BuildRequest(const HttpRequestSpec& spec) {
  http::request<http::string_body> req{spec.method, spec.target, 11};
  const bool default_port = (spec.use_tls && spec.port == 443) || (!spec.use_tls && spec.port == 80);
  req.set(http::field::host, default_port ? spec.host : spec.host + ":" + std::to_string(spec.port));
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  for (const auto& [name, value] : spec.headers) {
    req.set(name, value);
  }
  if (!spec.body.empty() || spec.method == http::verb::post) {
    req.body() = spec.body;
    req.prepare_payload();
  }
  return req;
}

template <typename Stream>
HttpResult Exchange(boost::asio::io_context& ioc, Stream& stream, const HttpRequestSpec& spec) {
  auto req = BuildRequest(spec);
  RunStep(ioc, "요청 쓰기", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  RunStep(ioc, "응답 읽기", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });
  return HttpResult{res.result_int(), std::move(res.body())};
}
}  // namespace

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl parsed;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    parsed.use_tls = true;
    parsed.port = 443;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    parsed.use_tls = false;
    parsed.port = 80;
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("지원하지 않는 URL 스킴: " + url);
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    auto port_str = authority.substr(colon + 1);
    authority = authority.substr(0, colon);
    try {
      std::size_t idx = 0;
      auto port = std::stoul(port_str, &idx);
      if (idx != port_str.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("port");
      }
      parsed.port = static_cast<unsigned short>(port);
    } catch (const std::exception&) {
      throw std::invalid_argument("URL 포트가 올바르지 않습니다: " + url);
    }
  }
  if (authority.empty()) {
    throw std::invalid_argument("URL 호스트가 비어 있습니다: " + url);
  }
  parsed.host = authority;
  return parsed;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResult HttpClient::Send(const HttpRequestSpec& spec) const {
  boost::asio::io_context ioc;
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  auto endpoints = ResolveEndpoints(ioc, spec, deadline);

  if (!spec.use_tls) {
    beast::tcp_stream stream{ioc};
    stream.expires_at(deadline);
    RunStep(ioc, "접속", [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
    auto result = Exchange(ioc, stream, spec);
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return result;
  }

  ssl::context ctx{ssl::context::tls_client};
  if (spec.verify_peer) {
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
  } else {
    ctx.set_verify_mode(ssl::verify_none);
  }

  beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};
  if (spec.verify_peer) {
    stream.set_verify_callback(ssl::host_name_verification(spec.host));
  }
  beast::error_code literal_ec;
  boost::asio::ip::make_address(spec.host, literal_ec);
  // IP 리터럴에는 SNI를 붙이지 않는다.
  if (literal_ec && !SSL_set_tlsext_host_name(stream.native_handle(), spec.host.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
    throw HttpClientError("SNI 설정 실패: " + ec.message());
  }

  beast::get_lowest_layer(stream).expires_at(deadline);
  RunStep(ioc, "접속", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });
  RunStep(ioc, "TLS 핸드셰이크",
          [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
  auto result = Exchange(ioc, stream, spec);
  beast::error_code ignored;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
  return result;
}

}  // namespace sessionproxy
