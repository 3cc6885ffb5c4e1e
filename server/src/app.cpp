/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 라우트 구성을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/payment_flow_test.cpp
 */
#include "wallet/app.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "wallet/http_session.hpp"
#include "wallet/middleware.hpp"
#include "wallet/transaction_handlers.hpp"

namespace wallet {

namespace {
std::size_t ResolveThreadCount(const AppConfig& config) {
  if (config.worker_threads > 0) {
    return config.worker_threads;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const Router> router, std::shared_ptr<const Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), router_(std::move(router)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->router_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<const Observability> observability_;
};

Handler MakeHandlerChain(Handler handler, std::shared_ptr<const Observability> observability) {
  return WithRequestId(WithInstrumentation(std::move(handler), std::move(observability)));
}

std::shared_ptr<Router> BuildRouter(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability) {
  auto router = std::make_shared<Router>();
  router->Handle("/pay", MakeHandlerChain(MakePayHandler(ledger, observability), observability));
  router->Handle("/save", MakeHandlerChain(MakeSaveHandler(ledger, observability), observability));
  router->SetNotFound(MakeHandlerChain(NotFoundHandler(), observability));
  return router;
}

ServerApp::ServerApp(const AppConfig& config)
    : ServerApp(config, std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo))) {}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<Observability> observability)
    : config_(config),
      ioc_(static_cast<int>(ResolveThreadCount(config))),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM),
      observability_(std::move(observability)) {
  ledger_ = std::make_shared<Ledger>(config.initial_balance, config.initial_bank);
  router_ = BuildRouter(ledger_, observability_);
}

ServerApp::~ServerApp() {
  Stop();
  JoinWorkers();
}

bool ServerApp::Run() {
  try {
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, router_, observability_);
    listener_->Run();
    // listener_가 준비된 뒤에야 Stop()이 리스너를 닫을 수 있다.
    running_ = true;
  } catch (const std::exception& ex) {
    std::cerr << "HTTP server error: " << ex.what() << "\n";
    return false;
  }

  std::cout << "Server starting on port " << config_.port << "...\n";
  auto snapshot = ledger_->Snapshot();
  observability_->Log(LogContext{LogLevel::kInfo, "", "server.start",
                                 {{"port", config_.port},
                                  {"balance", snapshot.balance},
                                  {"bank", snapshot.bank},
                                  {"threads", ResolveThreadCount(config_)}}});
  WaitForSignal();
  RunWorkers();
  ioc_.run();
  JoinWorkers();
  return true;
}

void ServerApp::WaitForSignal() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogContext{LogLevel::kInfo, "", "server.stop", {{"signal", signal_number}}});
    Stop();
  });
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count = ResolveThreadCount(config_);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

// 워커 스레드(시그널 핸들러)에서도 호출되므로 여기서는 join하지 않는다.
void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
}

}  // namespace wallet
