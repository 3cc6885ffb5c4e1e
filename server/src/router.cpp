/*
 * 설명: 경로 기반 라우팅과 404 응답을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#include "wallet/router.hpp"

#include <utility>

namespace wallet {

Handler NotFoundHandler() {
  return [](ResponseWriter& w, const Request& /*r*/) {
    w.SetHeader("Content-Type", "text/plain; charset=utf-8");
    w.WriteHeader(static_cast<unsigned>(boost::beast::http::status::not_found));
    w.Write(kNotFoundMessage);
  };
}

Router::Router() : not_found_(NotFoundHandler()) {}

void Router::Handle(const std::string& path, Handler handler) { routes_[path] = std::move(handler); }

void Router::SetNotFound(Handler handler) { not_found_ = std::move(handler); }

void Router::ServeHttp(ResponseWriter& w, const Request& r) const {
  auto it = routes_.find(r.Path());
  if (it == routes_.end()) {
    return not_found_(w, r);
  }
  it->second(w, r);
}

}  // namespace wallet
