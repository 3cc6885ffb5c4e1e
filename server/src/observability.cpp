/*
 * 설명: 구조화 로그를 JSON 한 줄로 직렬화해 싱크(기본 stdout)에 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "wallet/observability.hpp"

#include <chrono>
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wallet {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

void StdoutSink(const std::string& line) { std::cout << line << std::endl; }
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level), sink_(StdoutSink) {}

Observability::Observability(LogLevel min_level, Sink sink) : min_level_(min_level), sink_(std::move(sink)) {}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  try {
    nlohmann::json log_json;
    log_json["ts"] = CurrentTimestamp();
    log_json["level"] = ToString(ctx.level);
    log_json["requestId"] = ctx.request_id;
    log_json["event"] = ctx.name;
    if (ctx.fields.is_object()) {
      for (auto it = ctx.fields.begin(); it != ctx.fields.end(); ++it) {
        log_json[it.key()] = it.value();
      }
    }
    // 클라이언트가 보낸 X-Request-ID가 UTF-8이 아닐 수 있다.
    auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(line);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "log write failed: %s\n", ex.what());
  } catch (...) {
    std::fputs("log write failed: unknown error\n", stderr);
  }
}

}  // namespace wallet
