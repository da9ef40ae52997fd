/*
 * 설명: strand 위의 타이머 루프로 아웃박스를 폴링한다. 배치가 가득 차면 즉시 다음 주기를 돈다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.3, 5, S6)
 * 테스트: server/tests/unit/backoff_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#include "relay/dispatcher.hpp"

#include <algorithm>
#include <vector>

#include <boost/asio/post.hpp>

namespace relay {

std::chrono::milliseconds ComputeBackoff(std::uint32_t attempts, std::chrono::milliseconds base,
                                         std::chrono::milliseconds cap, std::chrono::milliseconds jitter) {
  if (attempts == 0) {
    attempts = 1;
  }
  auto delay = base;
  for (std::uint32_t i = 1; i < attempts && delay < cap; ++i) {
    delay *= 2;
  }
  return std::min(cap, delay + jitter);
}

Dispatcher::Dispatcher(boost::asio::io_context& ioc, std::shared_ptr<MariaDbClient> db_client,
                       std::shared_ptr<OutboxRepository> repository, std::shared_ptr<Publisher> publisher,
                       std::shared_ptr<Observability> observability, const DispatcherOptions& options)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), db_client_(std::move(db_client)),
      repository_(std::move(repository)), publisher_(std::move(publisher)), observability_(std::move(observability)),
      options_(options), rng_(std::random_device{}()) {}

void Dispatcher::Start() {
  if (running_.exchange(true)) {
    return;
  }
  if (observability_) {
    observability_->Info("dispatcher.started", {{"interval_ms", options_.interval.count()},
                                                {"batch_size", options_.batch_size}});
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->Schedule(std::chrono::milliseconds(0)); });
}

void Dispatcher::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
  if (observability_) {
    observability_->Info("dispatcher.stopped");
  }
}

void Dispatcher::Schedule(std::chrono::milliseconds delay) {
  timer_.expires_after(delay);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void Dispatcher::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  std::size_t processed = 0;
  try {
    processed = ProcessOnce();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Error("dispatcher.cycle_failed", {{"error", ex.what()}});
    }
  }
  if (!running_) {
    return;
  }
  Schedule(processed >= options_.batch_size ? std::chrono::milliseconds(0) : options_.interval);
}

std::size_t Dispatcher::ProcessOnce() {
  std::vector<OutboxEvent> batch;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    batch = repository_->FetchDue(conn, options_.batch_size, std::chrono::system_clock::now());
  });
  if (batch.empty()) {
    return 0;
  }

  struct Outcome {
    const OutboxEvent* event;
    bool delivered;
    std::uint32_t attempts;
    std::chrono::milliseconds delay;
    std::chrono::system_clock::time_point at;
    std::string error;
  };
  std::vector<Outcome> outcomes;
  outcomes.reserve(batch.size());
  for (const auto& event : batch) {
    Outcome outcome{&event, false, event.attempts, std::chrono::milliseconds(0), {}, {}};
    try {
      publisher_->Deliver(event);
      outcome.delivered = true;
    } catch (const std::exception& ex) {
      outcome.error = ex.what();
    }
    if (outcome.delivered) {
      outcome.at = std::chrono::system_clock::now();
    } else {
      outcome.attempts = event.attempts + 1;
      outcome.delay = ComputeBackoff(outcome.attempts, options_.backoff_base, options_.backoff_max, NextJitter());
      outcome.at = std::chrono::system_clock::now() + outcome.delay;
    }
    outcomes.push_back(std::move(outcome));
  }

  // 주기당 연결 하나로 기록한다. 재연결 시 같은 id UPDATE를 다시 수행한다.
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    for (const auto& outcome : outcomes) {
      if (outcome.delivered) {
        repository_->MarkPublished(conn, outcome.event->id, outcome.at);
      } else {
        repository_->MarkFailed(conn, outcome.event->id, outcome.attempts, outcome.at, outcome.error);
      }
    }
  });

  if (observability_) {
    for (const auto& outcome : outcomes) {
      if (outcome.delivered) {
        observability_->IncrementPublished();
        continue;
      }
      observability_->IncrementEventFailure();
      observability_->Warn("dispatcher.publish_failed", {{"event_id", outcome.event->event_id},
                                                         {"attempts", outcome.attempts},
                                                         {"retry_in_ms", outcome.delay.count()},
                                                         {"error", outcome.error}});
    }
  }
  return outcomes.size();
}

std::chrono::milliseconds Dispatcher::NextJitter() {
  auto upper = std::max<std::int64_t>(0, options_.backoff_base.count() / 4);
  std::uniform_int_distribution<std::int64_t> dist(0, upper);
  return std::chrono::milliseconds(dist(rng_));
}

}  // namespace relay
