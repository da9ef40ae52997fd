/*
 * 설명: 아웃박스 대기 이벤트를 주기적으로 읽어 발행하고, 실패 시 지수 백오프로 재시도를 예약한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.3, 5, S6)
 * 테스트: server/tests/unit/backoff_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "relay/db_client.hpp"
#include "relay/observability.hpp"
#include "relay/outbox.hpp"
#include "relay/publisher.hpp"

namespace relay {

// min(cap, base * 2^(attempts-1) + jitter). attempts는 1부터 센다.
std::chrono::milliseconds ComputeBackoff(std::uint32_t attempts, std::chrono::milliseconds base,
                                         std::chrono::milliseconds cap, std::chrono::milliseconds jitter);

struct DispatcherOptions {
  std::chrono::milliseconds interval{250};
  std::size_t batch_size{100};
  std::chrono::milliseconds backoff_base{500};
  std::chrono::milliseconds backoff_max{30000};
};

class Dispatcher : public std::enable_shared_from_this<Dispatcher> {
 public:
  Dispatcher(boost::asio::io_context& ioc, std::shared_ptr<MariaDbClient> db_client,
             std::shared_ptr<OutboxRepository> repository, std::shared_ptr<Publisher> publisher,
             std::shared_ptr<Observability> observability, const DispatcherOptions& options);

  void Start();
  void Stop();
  bool Running() const { return running_; }

  // 한 주기를 동기적으로 수행하고 처리한 이벤트 수를 돌려준다. 저장소 오류는 호출자에게 전파된다.
  std::size_t ProcessOnce();

 private:
  void Schedule(std::chrono::milliseconds delay);
  void OnTick(const boost::system::error_code& ec);
  std::chrono::milliseconds NextJitter();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<OutboxRepository> repository_;
  std::shared_ptr<Publisher> publisher_;
  std::shared_ptr<Observability> observability_;
  DispatcherOptions options_;
  std::atomic<bool> running_{false};
  std::mt19937 rng_;
};

}  // namespace relay
