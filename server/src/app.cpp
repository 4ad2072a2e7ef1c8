/*
 * 설명: 프록시 수명주기, 리스너, 구성 요소 연결과 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/handshake_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "sessionproxy/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "sessionproxy/api_response.hpp"
#include "sessionproxy/http_client.hpp"
#include "sessionproxy/http_session.hpp"
#include "sessionproxy/trusted_resolver.hpp"

namespace sessionproxy {

namespace {
constexpr unsigned short kDnsPort = 53;
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           boost::asio::thread_pool& handshake_pool, std::shared_ptr<HandshakeService> handshake_service,
           std::shared_ptr<SessionStore> store, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), handshake_pool_(handshake_pool),
        handshake_service_(std::move(handshake_service)), store_(std::move(store)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const { return acceptor_.local_endpoint().port(); }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->handshake_pool_, self->handshake_service_,
                                          self->store_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool& handshake_pool_;
  std::shared_ptr<HandshakeService> handshake_service_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<Observability> observability_;
};

std::shared_ptr<AccountResolver> BuildAccountResolver(const AppConfig& config, std::shared_ptr<HttpClient> client) {
  if (config.account_backend == AccountBackend::kApi) {
    if (config.account_endpoint.empty()) {
      throw std::runtime_error("PROXY_ACCOUNT_ENDPOINT가 필요합니다(api 백엔드)");
    }
    std::optional<std::string> secret;
    if (!config.account_secret.empty()) {
      secret = config.account_secret;
    }
    return std::make_shared<RemoteAccountResolver>(config.account_endpoint, secret, std::move(client));
  }
  auto accounts = StaticAccountResolver::LoadFromFile(config.accounts_file);
  std::cout << "계정 " << accounts->Size() << "개 로드: " << config.accounts_file << "\n";
  return accounts;
}

ProxyApp::ProxyApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)),
      handshake_pool_(std::max<std::size_t>(1, config.handshake_threads)) {
  auto client = std::make_shared<HttpClient>(std::chrono::milliseconds(config.upstream_timeout_ms));
  auto resolver = std::make_shared<TrustedResolver>(
      boost::asio::ip::udp::endpoint{boost::asio::ip::make_address(config.trusted_dns), kDnsPort},
      std::chrono::milliseconds(config.upstream_timeout_ms));
  auto upstream = std::make_shared<AuthorityConnector>(config.upstream_host, resolver, client);
  Wire(BuildAccountResolver(config, client), upstream);
}

ProxyApp::ProxyApp(const AppConfig& config, std::shared_ptr<AccountResolver> accounts,
                   std::shared_ptr<UpstreamConnector> upstream)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)),
      handshake_pool_(std::max<std::size_t>(1, config.handshake_threads)) {
  Wire(std::move(accounts), std::move(upstream));
}

ProxyApp::~ProxyApp() {
  Stop();
  handshake_pool_.join();
}

void ProxyApp::Wire(std::shared_ptr<AccountResolver> accounts, std::shared_ptr<UpstreamConnector> upstream) {
  observability_ = std::make_shared<Observability>();
  store_ = std::make_shared<SessionStore>(config_.sessions_file, observability_);
  store_->Load();
  handshake_service_ =
      std::make_shared<HandshakeService>(std::move(accounts), std::move(upstream), store_, observability_);
}

void ProxyApp::Start() {
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.bind_host), config_.bind_port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, handshake_pool_, handshake_service_, store_,
                                         observability_);
  listener_->Run();
  running_ = true;
  std::cout << "프록시 시작: " << config_.bind_host << ":" << BoundPort() << "\n";
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ProxyApp::Run() {
  Start();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void ProxyApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

unsigned short ProxyApp::BoundPort() const { return listener_ ? listener_->Port() : config_.bind_port; }

void ParseBindAddress(const std::string& value, std::string& host, unsigned short& port) {
  auto colon = value.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= value.size()) {
    throw std::invalid_argument("바인드 주소는 host:port 형식이어야 합니다: " + value);
  }
  auto port_str = value.substr(colon + 1);
  std::size_t idx = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(port_str, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument("바인드 포트가 올바르지 않습니다: " + value);
  }
  if (idx != port_str.size() || parsed > 65535) {
    throw std::invalid_argument("바인드 포트가 올바르지 않습니다: " + value);
  }
  host = value.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  port = static_cast<unsigned short>(parsed);
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  ParseBindAddress(get_env("YGG_BIND_ADDRESS", "0.0.0.0:3000"), cfg.bind_host, cfg.bind_port);
  auto backend = ToLower(get_env("PROXY_ACCOUNT_BACKEND", "file"));
  if (backend == "api") {
    cfg.account_backend = AccountBackend::kApi;
  } else if (backend == "file") {
    cfg.account_backend = AccountBackend::kFile;
  } else {
    throw std::invalid_argument("PROXY_ACCOUNT_BACKEND는 file 또는 api여야 합니다: " + backend);
  }
  cfg.accounts_file = get_env("PROXY_ACCOUNTS_FILE", "accounts.json");
  cfg.account_endpoint = get_env("PROXY_ACCOUNT_ENDPOINT", "");
  cfg.account_secret = get_env("PROXY_ACCOUNT_SECRET", "");
  cfg.sessions_file = get_env("PROXY_SESSIONS_FILE", "sessions.json");
  cfg.upstream_host = get_env("PROXY_UPSTREAM_HOST", "sessionserver.mojang.com");
  cfg.trusted_dns = get_env("PROXY_TRUSTED_DNS", "1.1.1.1");
  cfg.upstream_timeout_ms = static_cast<std::size_t>(std::stoul(get_env("PROXY_UPSTREAM_TIMEOUT_MS", "5000")));
  cfg.handshake_threads = static_cast<std::size_t>(std::stoul(get_env("PROXY_HANDSHAKE_THREADS", "4")));
  return cfg;
}

}  // namespace sessionproxy
