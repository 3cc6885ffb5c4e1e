/*
 * 설명: HTTP 연결 하나를 처리한다. 요청을 읽어 라우터에 넘기고 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "wallet/config.hpp"
#include "wallet/handler.hpp"
#include "wallet/observability.hpp"
#include "wallet/router.hpp"

namespace wallet {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<const Router> router,
              std::shared_ptr<const Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleReadError(boost::beast::error_code ec);
  void SendResponse(std::shared_ptr<HttpResponse> res);
  void OnWrite(bool close, boost::beast::error_code ec);
  void DoClose();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  AppConfig config_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<const Observability> observability_;
};

}  // namespace wallet
