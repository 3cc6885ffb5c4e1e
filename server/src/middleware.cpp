/*
 * 설명: 요청 ID 미들웨어와 계측 미들웨어를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/middleware_test.cpp
 */
#include "wallet/middleware.hpp"

#include <chrono>
#include <utility>

#include "wallet/status_recorder.hpp"

namespace wallet {

Handler WithRequestId(Handler next, RandomSource source) {
  return [next = std::move(next), source = std::move(source)](ResponseWriter& w, const Request& r) {
    auto request_id = ResolveRequestId(r.Header(kRequestIdHeader), source);
    w.SetHeader(kRequestIdHeader, request_id);
    next(w, r.WithContext(r.context.WithValue(kRequestIdKey, std::move(request_id))));
  };
}

Handler WithInstrumentation(Handler next, std::shared_ptr<const Observability> observability) {
  return [next = std::move(next), observability = std::move(observability)](ResponseWriter& w, const Request& r) {
    const auto request_id = GetRequestId(r.context);
    const auto method = r.Method();
    const auto path = r.Path();
    if (observability) {
      observability->Log(LogContext{LogLevel::kInfo, request_id, "request.start",
                                    {{"method", method}, {"path", path}}});
    }

    StatusRecorder recorder(w);
    auto start = std::chrono::steady_clock::now();
    next(recorder, r);
    auto elapsed = std::chrono::steady_clock::now() - start;

    if (observability) {
      auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
      observability->Log(LogContext{LogLevel::kInfo, request_id, "request.end",
                                    {{"method", method},
                                     {"path", path},
                                     {"status", recorder.Status()},
                                     {"durationUs", duration_us}}});
    }
  };
}

}  // namespace wallet
