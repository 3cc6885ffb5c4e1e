/*
 * 설명: 서버 전체 수명주기(원장, 로거, 라우터, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "wallet/config.hpp"
#include "wallet/ledger.hpp"
#include "wallet/observability.hpp"
#include "wallet/router.hpp"

namespace wallet {

class Listener;

// 요청 ID -> 계측 -> 핸들러 순서의 체인을 만든다.
Handler MakeHandlerChain(Handler handler, std::shared_ptr<const Observability> observability);

std::shared_ptr<Router> BuildRouter(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability);

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ServerApp(const AppConfig& config, std::shared_ptr<Observability> observability);
  ~ServerApp();

  // 리스너 생성 실패 시 false. 정상 종료 시 true.
  bool Run();
  void Stop();

  std::shared_ptr<Ledger> GetLedger() { return ledger_; }

 private:
  void RunWorkers();
  void JoinWorkers();
  void WaitForSignal();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<Ledger> ledger_;
  std::shared_ptr<Router> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace wallet
