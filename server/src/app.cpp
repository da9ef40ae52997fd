/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다. 종료 시 디스패처를 멈추고 모든 세션을 닫는다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S6)
 * 테스트: server/tests/e2e/realtime_flow_test.cpp, server/tests/e2e/message_api_test.cpp
 */
#include "relay/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/http_session.hpp"
#include "relay/schema.hpp"

namespace relay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<CredentialVerifier> verifier, std::shared_ptr<MembershipChecker> membership,
           std::shared_ptr<MessageService> message_service, std::shared_ptr<ConnectionRegistry> registry,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), verifier_(std::move(verifier)),
        membership_(std::move(membership)), message_service_(std::move(message_service)),
        registry_(std::move(registry)), observability_(std::move(observability)) {
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
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->verifier_, self->membership_,
                                          self->message_service_, self->registry_, self->observability_)
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
  std::shared_ptr<CredentialVerifier> verifier_;
  std::shared_ptr<MembershipChecker> membership_;
  std::shared_ptr<MessageService> message_service_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))),
      work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM), shutdown_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  registry_ = std::make_shared<ConnectionRegistry>(config.ws_max_subscriptions);
  registry_->SetObservability(observability_);
  verifier_ = std::make_shared<HmacCredentialVerifier>(config.auth_token_secret);
  membership_ = std::make_shared<MariaDbMembershipChecker>(db_client_);
  sequencer_ = std::make_shared<Sequencer>(db_client_);
  outbox_writer_ = std::make_shared<OutboxWriter>(db_client_);
  outbox_repository_ = std::make_shared<OutboxRepository>(db_client_);
  message_service_ = std::make_shared<MessageService>(db_client_, sequencer_, outbox_writer_);
  publisher_ = std::make_shared<Publisher>(registry_, observability_);
  DispatcherOptions options;
  options.interval = std::chrono::milliseconds(config.dispatch_interval_ms);
  options.batch_size = config.dispatch_batch_size;
  options.backoff_base = std::chrono::milliseconds(config.dispatch_backoff_base_ms);
  options.backoff_max = std::chrono::milliseconds(config.dispatch_backoff_max_ms);
  dispatcher_ = std::make_shared<Dispatcher>(ioc_, db_client_, outbox_repository_, publisher_, observability_, options);
}

ServerApp::~ServerApp() {
  Stop();
  ioc_.stop();
  JoinWorkers();
}

void ServerApp::Run() {
  running_ = true;
  EnsureSchema(*db_client_);
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, verifier_, membership_, message_service_,
                                         registry_, observability_);
  listener_->Run();
  dispatcher_->Start();
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Info("server.signal", {{"signal", signal_number}});
    Stop();
  });
  observability_->Info("server.started", {{"port", config_.port}});
  RunWorkers();
  ioc_.run();
  JoinWorkers();
  observability_->Info("server.stopped");
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  dispatcher_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  auto sessions = registry_->DrainAll();
  for (const auto& session : sessions) {
    session->ForceClose("server_shutdown");
  }
  observability_->Info("server.stopping", {{"closed_sessions", sessions.size()}});
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  work_guard_.reset();
  // close 프레임이 나갈 시간을 준 뒤 이벤트 루프를 멈춘다.
  shutdown_timer_.expires_after(std::chrono::seconds(1));
  shutdown_timer_.async_wait([this](const boost::system::error_code&) { ioc_.stop(); });
}

}  // namespace relay
