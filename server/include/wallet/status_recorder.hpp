/*
 * 설명: 응답 쓰기를 그대로 전달하면서 최종 상태 코드를 관찰한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/status_recorder_test.cpp
 */
#pragma once

#include "wallet/handler.hpp"

namespace wallet {

class StatusRecorder : public ResponseWriter {
 public:
  explicit StatusRecorder(ResponseWriter& inner);

  void SetHeader(std::string_view name, std::string_view value) override;
  std::string Header(std::string_view name) const override;
  void WriteHeader(unsigned status) override;
  void Write(std::string_view data) override;

  unsigned Status() const { return status_; }

 private:
  ResponseWriter& inner_;
  unsigned status_{200};
  bool header_written_{false};
};

}  // namespace wallet
