/*
 * 설명: Beast 메시지 위에 요청/응답 추상화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/status_recorder_test.cpp
 */
#include "wallet/handler.hpp"

namespace wallet {
namespace {
boost::beast::string_view ToBeast(std::string_view value) { return {value.data(), value.size()}; }
}  // namespace

MessageResponseWriter::MessageResponseWriter(HttpResponse& response) : response_(response) {}

void MessageResponseWriter::SetHeader(std::string_view name, std::string_view value) {
  response_.set(ToBeast(name), ToBeast(value));
}

std::string MessageResponseWriter::Header(std::string_view name) const {
  auto it = response_.find(ToBeast(name));
  return it == response_.end() ? std::string() : std::string(it->value());
}

void MessageResponseWriter::WriteHeader(unsigned status) {
  if (header_written_) {
    return;
  }
  header_written_ = true;
  response_.result(status);
}

void MessageResponseWriter::Write(std::string_view data) {
  if (!header_written_) {
    WriteHeader(static_cast<unsigned>(boost::beast::http::status::ok));
  }
  response_.body().append(data.data(), data.size());
}

std::string Request::Method() const { return std::string(message->method_string()); }

std::string Request::Path() const {
  std::string target = std::string(message->target());
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    target.resize(qpos);
  }
  return target;
}

std::string Request::Header(std::string_view name) const {
  auto it = message->find(ToBeast(name));
  return it == message->end() ? std::string() : std::string(it->value());
}

Request MakeRequest(HttpRequest message) {
  return Request{std::make_shared<const HttpRequest>(std::move(message)), RequestContext{}};
}

}  // namespace wallet
