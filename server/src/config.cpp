/*
 * 설명: 환경변수에서 서버 설정을 읽고 값을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "wallet/config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "wallet/observability.hpp"

namespace wallet {

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

long long ParseInteger(const char* key, const std::string& text, long long min, long long max) {
  // stoll은 앞쪽 공백을 건너뛰므로 따로 막는다.
  if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    throw std::invalid_argument(std::string(key) + " is not an integer: " + text);
  }
  std::size_t idx = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string(key) + " is not an integer: " + text);
  }
  if (idx != text.size() || value < min || value > max) {
    throw std::invalid_argument(std::string(key) + " is out of range: " + text);
  }
  return value;
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  constexpr long long kInt64Max = std::numeric_limits<long long>::max();

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseInteger("SERVER_PORT", GetEnv("SERVER_PORT", "9097"), 1, 65535));
  cfg.initial_balance = ParseInteger("INITIAL_BALANCE", GetEnv("INITIAL_BALANCE", "1000"), 0, kInt64Max);
  cfg.initial_bank = ParseInteger("INITIAL_BANK", GetEnv("INITIAL_BANK", "0"), 0, kInt64Max);
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  if (!ParseLogLevel(cfg.log_level)) {
    throw std::invalid_argument("LOG_LEVEL is not one of debug/info/warn/error: " + cfg.log_level);
  }
  cfg.max_body_bytes =
      static_cast<std::size_t>(ParseInteger("MAX_BODY_BYTES", GetEnv("MAX_BODY_BYTES", "8192"), 1, kInt64Max));
  cfg.worker_threads =
      static_cast<std::size_t>(ParseInteger("WORKER_THREADS", GetEnv("WORKER_THREADS", "0"), 0, 1024));
  return cfg;
}

}  // namespace wallet
