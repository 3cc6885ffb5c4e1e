/*
 * 설명: HTTP 요청을 읽어 라우터로 전달하고, 본문 읽기 실패는 텍스트 응답으로 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#include "wallet/http_session.hpp"

#include <chrono>
#include <string>

#include "wallet/request_id.hpp"

namespace wallet {

namespace {
constexpr auto kReadTimeout = std::chrono::seconds(30);
constexpr char kServerName[] = "wallet-server";
constexpr char kBodyReadErrorPrefix[] = "error read HTTP body: ";

bool IsHttpParseError(const boost::beast::error_code& ec) {
  return ec.category() == boost::beast::http::make_error_code(boost::beast::http::error::body_limit).category();
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const Router> router, std::shared_ptr<const Observability> observability)
    : stream_(std::move(socket)), config_(config), router_(std::move(router)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  parser_.emplace();
  parser_->body_limit(config_.max_body_bytes);
  stream_.expires_after(kReadTimeout);
  boost::beast::http::async_read(
      stream_, buffer_, *parser_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    return DoClose();
  }
  if (ec) {
    if (IsHttpParseError(ec)) {
      return HandleReadError(ec);
    }
    return;
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto request = MakeRequest(parser_->release());
  auto res = std::make_shared<HttpResponse>();
  res->version(request.message->version());
  res->keep_alive(request.message->keep_alive());
  res->set(http::field::server, kServerName);
  res->result(http::status::ok);

  MessageResponseWriter writer(*res);
  try {
    router_->ServeHttp(writer, request);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kError, std::string((*res)[kRequestIdHeader]),
                                     "request.handler_error", {{"reason", ex.what()}}});
    }
    res->result(http::status::internal_server_error);
    res->set(http::field::content_type, "text/plain; charset=utf-8");
    res->body() = "internal error";
  }
  res->prepare_payload();
  SendResponse(res);
}

void HttpSession::HandleReadError(boost::beast::error_code ec) {
  using namespace boost::beast;
  std::string header_id;
  if (parser_ && parser_->is_header_done()) {
    auto it = parser_->get().find(kRequestIdHeader);
    if (it != parser_->get().end()) {
      header_id = std::string(it->value());
    }
  }
  auto request_id = ResolveRequestId(header_id);
  auto message = kBodyReadErrorPrefix + ec.message();
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kWarn, request_id, "request.read_error", {{"reason", ec.message()}}});
  }

  auto res = std::make_shared<HttpResponse>();
  res->version(11);
  res->result(http::status::ok);
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "text/plain; charset=utf-8");
  res->set(kRequestIdHeader, request_id);
  // 파서 상태를 신뢰할 수 없으므로 응답 후 연결을 닫는다.
  res->keep_alive(false);
  res->body() = message;
  res->prepare_payload();
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  bool close = res->need_eof();
  boost::beast::http::async_write(
      stream_, *res,
      [self, res, close](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        self->OnWrite(close, ec);
      });
}

void HttpSession::OnWrite(bool close, boost::beast::error_code ec) {
  if (ec) {
    return;
  }
  if (close) {
    return DoClose();
  }
  DoRead();
}

void HttpSession::DoClose() {
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace wallet
