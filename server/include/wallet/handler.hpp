/*
 * 설명: 미들웨어 체인이 공유하는 요청/응답 추상화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/status_recorder_test.cpp, server/tests/unit/middleware_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

#include "wallet/request_context.hpp"

namespace wallet {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// 핸들러가 응답을 쓰는 데 필요한 최소 연산.
class ResponseWriter {
 public:
  virtual ~ResponseWriter() = default;

  virtual void SetHeader(std::string_view name, std::string_view value) = 0;
  virtual std::string Header(std::string_view name) const = 0;
  // 첫 호출만 유효하다. 본문을 먼저 쓰면 200으로 확정된다.
  virtual void WriteHeader(unsigned status) = 0;
  virtual void Write(std::string_view data) = 0;
};

// Beast 응답 메시지에 직접 쓰는 실제 싱크.
class MessageResponseWriter : public ResponseWriter {
 public:
  explicit MessageResponseWriter(HttpResponse& response);

  void SetHeader(std::string_view name, std::string_view value) override;
  std::string Header(std::string_view name) const override;
  void WriteHeader(unsigned status) override;
  void Write(std::string_view data) override;

  bool HeaderWritten() const { return header_written_; }

 private:
  HttpResponse& response_;
  bool header_written_{false};
};

struct Request {
  std::shared_ptr<const HttpRequest> message;
  RequestContext context;

  std::string Method() const;
  // 쿼리 문자열을 제외한 경로.
  std::string Path() const;
  std::string Header(std::string_view name) const;
  const std::string& Body() const { return message->body(); }

  Request WithContext(RequestContext ctx) const { return Request{message, std::move(ctx)}; }
};

using Handler = std::function<void(ResponseWriter&, const Request&)>;

Request MakeRequest(HttpRequest message);

}  // namespace wallet
