/*
 * 설명: 요청 상관관계 ID(X-Request-ID)를 생성하거나 전달받은 값을 재사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/request_id_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "wallet/request_context.hpp"

namespace wallet {

inline constexpr char kRequestIdHeader[] = "X-Request-ID";
inline constexpr char kFallbackRequestId[] = "fallback-id";

extern const ContextKey<std::string> kRequestIdKey;

// 난수원 실패 시 false를 돌려준다.
using RandomSource = std::function<bool(unsigned char* out, std::size_t len)>;

bool OpenSslRandom(unsigned char* out, std::size_t len);

// 16바이트 난수를 패딩 없는 base64url(22자)로 인코딩한다.
std::string GenerateRequestId(const RandomSource& source = OpenSslRandom);

// 헤더 값이 비어 있거나 공백뿐이면 새 ID를 생성한다.
std::string ResolveRequestId(std::string_view header_value, const RandomSource& source = OpenSslRandom);

std::string GetRequestId(const RequestContext* ctx);
std::string GetRequestId(const RequestContext& ctx);

}  // namespace wallet
