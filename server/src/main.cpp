/*
 * 설명: 프록시 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <csignal>
#include <cstdlib>
#include <iostream>

#include "sessionproxy/app.hpp"

int main() {
  using namespace sessionproxy;
  try {
    AppConfig config = LoadConfigFromEnv();
    ProxyApp app(config);

    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료합니다\n";
      std::_Exit(0);
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "프록시 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
