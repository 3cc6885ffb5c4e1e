/*
 * 설명: 요청 단위 구조화 로그(JSON 한 줄)를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/middleware_test.cpp
 */
#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wallet {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
const char* ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string request_id;
  std::string name;
  nlohmann::json fields = nlohmann::json::object();
};

class Observability {
 public:
  using Sink = std::function<void(const std::string& line)>;

  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  Observability(LogLevel min_level, Sink sink);

  bool Enabled(LogLevel level) const { return level >= min_level_; }

  // 싱크에서 발생한 예외는 종류와 무관하게 여기서 끝난다. 호출자에게 전파되지 않는다.
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  Sink sink_;
  mutable std::mutex mutex_;
};

}  // namespace wallet
