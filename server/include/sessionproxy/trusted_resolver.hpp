/*
 * 설명: 시스템 리졸버를 거치지 않고 지정한 DNS 서버에 직접 A 레코드를 질의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trusted_resolver_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

namespace sessionproxy {

class DnsError : public std::runtime_error {
 public:
  explicit DnsError(const std::string& message) : std::runtime_error(message) {}
};

namespace dns {

constexpr std::uint16_t kTypeA = 1;
constexpr std::uint16_t kTypeCname = 5;
constexpr std::uint16_t kClassIn = 1;

// 표준 질의(RD=1) 하나를 만든다. 레이블이 63바이트를 넘으면 DnsError.
std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::string& hostname);

// 응답에서 A 레코드를 순서대로 꺼낸다. id 불일치, RCODE 오류, 잘린 메시지는 DnsError.
std::vector<boost::asio::ip::address_v4> ParseResponse(const std::vector<std::uint8_t>& message,
                                                       std::uint16_t expected_id);

}  // namespace dns

class TrustedResolver {
 public:
  TrustedResolver(boost::asio::ip::udp::endpoint server, std::chrono::milliseconds timeout);

  // 첫 번째 A 레코드를 돌려준다. 결과가 없거나 질의가 실패하면 DnsError. 대체 리졸버는 없다.
  boost::asio::ip::address_v4 ResolveFirst(const std::string& hostname) const;

  const boost::asio::ip::udp::endpoint& Server() const { return server_; }

 private:
  boost::asio::ip::udp::endpoint server_;
  std::chrono::milliseconds timeout_;
};

}  // namespace sessionproxy
