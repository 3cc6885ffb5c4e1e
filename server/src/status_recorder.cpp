/*
 * 설명: 첫 상태 코드 설정만 기록/전달하고 나머지는 내부 싱크로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/status_recorder_test.cpp
 */
#include "wallet/status_recorder.hpp"

namespace wallet {

StatusRecorder::StatusRecorder(ResponseWriter& inner) : inner_(inner) {}

void StatusRecorder::SetHeader(std::string_view name, std::string_view value) { inner_.SetHeader(name, value); }

std::string StatusRecorder::Header(std::string_view name) const { return inner_.Header(name); }

void StatusRecorder::WriteHeader(unsigned status) {
  if (header_written_) {
    return;
  }
  header_written_ = true;
  status_ = status;
  inner_.WriteHeader(status);
}

void StatusRecorder::Write(std::string_view data) {
  // 상태 없이 본문을 쓰면 200으로 확정된다.
  header_written_ = true;
  inner_.Write(data);
}

}  // namespace wallet
