/*
 * 설명: 서버 전체 수명주기를 관리한다. 스키마 준비, 리스너, 디스패처, 종료 처리.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S6)
 * 테스트: server/tests/e2e/realtime_flow_test.cpp, server/tests/e2e/message_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "relay/config.hpp"
#include "relay/connection_registry.hpp"
#include "relay/credentials.hpp"
#include "relay/db_client.hpp"
#include "relay/dispatcher.hpp"
#include "relay/membership.hpp"
#include "relay/message_service.hpp"
#include "relay/observability.hpp"
#include "relay/outbox.hpp"
#include "relay/publisher.hpp"
#include "relay/sequencer.hpp"

namespace relay {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Dispatcher> GetDispatcher() { return dispatcher_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer shutdown_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<CredentialVerifier> verifier_;
  std::shared_ptr<MembershipChecker> membership_;
  std::shared_ptr<Sequencer> sequencer_;
  std::shared_ptr<OutboxWriter> outbox_writer_;
  std::shared_ptr<OutboxRepository> outbox_repository_;
  std::shared_ptr<MessageService> message_service_;
  std::shared_ptr<Publisher> publisher_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace relay
