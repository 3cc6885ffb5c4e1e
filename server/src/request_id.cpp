/*
 * 설명: OpenSSL 난수로 요청 ID를 만들고 요청 컨텍스트에서 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/request_id_test.cpp
 */
#include "wallet/request_id.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace wallet {

const ContextKey<std::string> kRequestIdKey{};

namespace {
constexpr std::size_t kRequestIdBytes = 16;

std::string EncodeBase64Url(const std::vector<unsigned char>& data) {
  std::vector<unsigned char> encoded(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(encoded.data(), data.data(), static_cast<int>(data.size()));
  std::string out(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(len));
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

bool IsBlank(std::string_view value) {
  return std::all_of(value.begin(), value.end(),
                     [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}
}  // namespace

bool OpenSslRandom(unsigned char* out, std::size_t len) { return RAND_bytes(out, static_cast<int>(len)) == 1; }

std::string GenerateRequestId(const RandomSource& source) {
  std::vector<unsigned char> buffer(kRequestIdBytes);
  if (!source || !source(buffer.data(), buffer.size())) {
    return kFallbackRequestId;
  }
  return EncodeBase64Url(buffer);
}

std::string ResolveRequestId(std::string_view header_value, const RandomSource& source) {
  if (header_value.empty() || IsBlank(header_value)) {
    return GenerateRequestId(source);
  }
  return std::string(header_value);
}

std::string GetRequestId(const RequestContext* ctx) {
  if (ctx == nullptr) {
    return "";
  }
  return GetRequestId(*ctx);
}

std::string GetRequestId(const RequestContext& ctx) {
  const auto* value = ctx.Value(kRequestIdKey);
  return value ? *value : std::string{};
}

}  // namespace wallet
