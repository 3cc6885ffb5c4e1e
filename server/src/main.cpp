/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "wallet/app.hpp"

int main() {
  using namespace wallet;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    return app.Run() ? 0 : 1;
  } catch (const std::invalid_argument& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }
}
