/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wallet {

struct AppConfig {
  unsigned short port{9097};
  std::int64_t initial_balance{1000};
  std::int64_t initial_bank{0};
  std::string log_level{"info"};
  std::size_t max_body_bytes{8192};
  // 0이면 하드웨어 스레드 수를 따른다.
  std::size_t worker_threads{0};
};

// 잘못된 값이 있으면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace wallet
