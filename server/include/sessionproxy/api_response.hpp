/*
 * 설명: 인증 서버와 같은 모양의 오류 본문과 URL 인코딩 유틸리티를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace sessionproxy {

// {"error": ..., "errorMessage": ...} 형태. 클라이언트는 인증 서버의 오류 모양을 기대한다.
nlohmann::json MakeErrorBody(std::string_view error, std::string_view message);

std::string UrlEncode(std::string_view value);
std::string UrlDecode(std::string_view value);

// a=b&c=d 형태의 쿼리를 디코딩해 맵으로 만든다. 중복 키는 첫 값을 유지한다.
std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query);

std::string ToLower(std::string_view value);

// 과잉 길이 인코딩과 서로게이트 범위를 포함해 잘못된 시퀀스를 거부한다.
bool IsValidUtf8(std::string_view value);

}  // namespace sessionproxy
