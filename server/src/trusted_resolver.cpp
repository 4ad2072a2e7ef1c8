/*
 * 설명: DNS 질의 메시지를 만들고 UDP로 신뢰 리졸버에 보내 A 레코드를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trusted_resolver_test.cpp
 */
#include "sessionproxy/trusted_resolver.hpp"

#include <array>
#include <functional>
#include <random>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace sessionproxy {
namespace {
constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxUdpMessage = 1232;

std::uint16_t ReadU16(const std::vector<std::uint8_t>& msg, std::size_t pos) {
  if (pos + 2 > msg.size()) {
    throw DnsError("DNS 응답이 잘렸습니다");
  }
  return static_cast<std::uint16_t>((msg[pos] << 8) | msg[pos + 1]);
}

void WriteU16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xff));
  out.push_back(static_cast<std::uint8_t>(value & 0xff));
}

// 이름 필드를 건너뛴 다음 위치를 돌려준다. 압축 포인터(0xC0)는 2바이트로 끝난다.
std::size_t SkipName(const std::vector<std::uint8_t>& msg, std::size_t pos) {
  while (true) {
    if (pos >= msg.size()) {
      throw DnsError("DNS 이름이 잘렸습니다");
    }
    std::uint8_t len = msg[pos];
    if ((len & 0xC0) == 0xC0) {
      if (pos + 2 > msg.size()) {
        throw DnsError("DNS 압축 포인터가 잘렸습니다");
      }
      return pos + 2;
    }
    if ((len & 0xC0) != 0) {
      throw DnsError("지원하지 않는 DNS 레이블 형식");
    }
    if (len == 0) {
      return pos + 1;
    }
    pos += len + 1;
  }
}

std::uint16_t NextQueryId() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 0xffff);
  return static_cast<std::uint16_t>(dist(gen));
}
}  // namespace

namespace dns {

std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::string& hostname) {
  std::vector<std::uint8_t> out;
  out.reserve(kHeaderSize + hostname.size() + 6);
  WriteU16(out, id);
  WriteU16(out, 0x0100);  // RD
  WriteU16(out, 1);       // QDCOUNT
  WriteU16(out, 0);
  WriteU16(out, 0);
  WriteU16(out, 0);

  std::size_t start = 0;
  while (start < hostname.size()) {
    auto dot = hostname.find('.', start);
    auto end = dot == std::string::npos ? hostname.size() : dot;
    auto len = end - start;
    if (len == 0) {
      throw DnsError("빈 DNS 레이블: " + hostname);
    }
    if (len > kMaxLabel) {
      throw DnsError("DNS 레이블이 너무 깁니다: " + hostname);
    }
    out.push_back(static_cast<std::uint8_t>(len));
    out.insert(out.end(), hostname.begin() + static_cast<std::ptrdiff_t>(start),
               hostname.begin() + static_cast<std::ptrdiff_t>(end));
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  out.push_back(0);
  WriteU16(out, kTypeA);
  WriteU16(out, kClassIn);
  return out;
}

std::vector<boost::asio::ip::address_v4> ParseResponse(const std::vector<std::uint8_t>& message,
                                                       std::uint16_t expected_id) {
  if (message.size() < kHeaderSize) {
    throw DnsError("DNS 응답이 헤더보다 짧습니다");
  }
  if (ReadU16(message, 0) != expected_id) {
    throw DnsError("DNS 응답 id 불일치");
  }
  const std::uint16_t flags = ReadU16(message, 2);
  if ((flags & 0x8000) == 0) {
    throw DnsError("DNS 응답 플래그가 아닙니다");
  }
  if ((flags & 0x0200) != 0) {
    throw DnsError("DNS 응답이 잘렸습니다(TC)");
  }
  const std::uint16_t rcode = flags & 0x000F;
  if (rcode != 0) {
    throw DnsError("DNS 질의 실패, RCODE=" + std::to_string(rcode));
  }

  const std::uint16_t questions = ReadU16(message, 4);
  const std::uint16_t answers = ReadU16(message, 6);
  std::size_t pos = kHeaderSize;
  for (std::uint16_t i = 0; i < questions; ++i) {
    pos = SkipName(message, pos) + 4;
  }

  std::vector<boost::asio::ip::address_v4> addresses;
  for (std::uint16_t i = 0; i < answers; ++i) {
    pos = SkipName(message, pos);
    const std::uint16_t type = ReadU16(message, pos);
    const std::uint16_t klass = ReadU16(message, pos + 2);
    const std::uint16_t rdlength = ReadU16(message, pos + 8);
    pos += 10;
    if (pos + rdlength > message.size()) {
      throw DnsError("DNS 레코드 데이터가 잘렸습니다");
    }
    if (type == kTypeA && klass == kClassIn && rdlength == 4) {
      boost::asio::ip::address_v4::bytes_type bytes{message[pos], message[pos + 1], message[pos + 2],
                                                    message[pos + 3]};
      addresses.emplace_back(bytes);
    }
    pos += rdlength;
  }
  return addresses;
}

}  // namespace dns

TrustedResolver::TrustedResolver(boost::asio::ip::udp::endpoint server, std::chrono::milliseconds timeout)
    : server_(std::move(server)), timeout_(timeout) {}

boost::asio::ip::address_v4 TrustedResolver::ResolveFirst(const std::string& hostname) const {
  std::string name = hostname;
  if (!name.empty() && name.back() == '.') {
    name.pop_back();
  }
  const std::uint16_t id = NextQueryId();
  const auto query = dns::EncodeQuery(id, name);

  boost::asio::io_context ioc;
  boost::asio::ip::udp::socket socket{ioc};
  boost::asio::steady_timer timer{ioc};
  std::array<std::uint8_t, kMaxUdpMessage> recv_buffer{};
  boost::asio::ip::udp::endpoint sender;
  boost::system::error_code result;
  std::size_t received = 0;
  bool timed_out = false;

  socket.open(server_.protocol(), result);
  if (result) {
    throw DnsError("UDP 소켓 열기 실패: " + result.message());
  }
  timer.expires_after(timeout_);
  timer.async_wait([&](boost::system::error_code ec) {
    if (!ec) {
      timed_out = true;
      boost::system::error_code ignored;
      socket.close(ignored);
    }
  });
  // 설정한 리졸버가 아닌 곳에서 온 응답은 버리고 계속 기다린다. 시간 제한은 그대로 적용된다.
  std::function<void()> receive = [&]() {
    socket.async_receive_from(boost::asio::buffer(recv_buffer), sender,
                              [&](boost::system::error_code recv_ec, std::size_t bytes) {
                                if (!recv_ec && sender != server_) {
                                  receive();
                                  return;
                                }
                                timer.cancel();
                                result = recv_ec;
                                received = bytes;
                              });
  };
  socket.async_send_to(boost::asio::buffer(query), server_, [&](boost::system::error_code ec, std::size_t) {
    if (ec) {
      result = ec;
      timer.cancel();
      return;
    }
    receive();
  });
  ioc.run();

  if (timed_out) {
    throw DnsError("DNS 질의 시간 초과: " + server_.address().to_string());
  }
  if (result) {
    throw DnsError("DNS 질의 실패: " + result.message());
  }
  std::vector<std::uint8_t> response(recv_buffer.begin(), recv_buffer.begin() + static_cast<std::ptrdiff_t>(received));
  auto addresses = dns::ParseResponse(response, id);
  if (addresses.empty()) {
    throw DnsError("A 레코드 없음: " + name);
  }
  return addresses.front();
}

}  // namespace sessionproxy
