/*
 * 설명: 경로별 핸들러 체인을 등록하고 요청을 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#pragma once

#include <string>
#include <unordered_map>

#include "wallet/handler.hpp"

namespace wallet {

inline constexpr char kNotFoundMessage[] = "not found";

// 서버 시작 전에 등록을 마친다. 이후에는 읽기만 하므로 여러 스레드에서 공유해도 된다.
class Router {
 public:
  Router();

  // 메서드와 무관하게 경로만으로 매칭한다.
  void Handle(const std::string& path, Handler handler);
  void SetNotFound(Handler handler);
  void ServeHttp(ResponseWriter& w, const Request& r) const;

 private:
  std::unordered_map<std::string, Handler> routes_;
  Handler not_found_;
};

Handler NotFoundHandler();

}  // namespace wallet
