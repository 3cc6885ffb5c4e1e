/*
 * 설명: 요청 ID 부여와 요청 계측(시작/종료 로그) 미들웨어를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/middleware_test.cpp
 */
#pragma once

#include <memory>

#include "wallet/handler.hpp"
#include "wallet/observability.hpp"
#include "wallet/request_id.hpp"

namespace wallet {

// X-Request-ID를 결정해 컨텍스트에 싣고 응답 헤더로 되돌려준다.
Handler WithRequestId(Handler next, RandomSource source = OpenSslRandom);

// 내부 핸들러 호출 전후로 request.start / request.end 로그를 남긴다.
Handler WithInstrumentation(Handler next, std::shared_ptr<const Observability> observability);

}  // namespace wallet
