/*
 * 설명: 아웃박스 이벤트를 이벤트 프레임으로 한 번 직렬화해 구독 세션 전체에 밀어 넣는다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.6, S4)
 * 테스트: server/tests/unit/publisher_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "relay/connection_registry.hpp"
#include "relay/observability.hpp"
#include "relay/outbox.hpp"

namespace relay {

struct DeliveryOutcome {
  std::size_t recipients{0};
  std::size_t delivered{0};
  std::size_t dropped{0};
};

// 조회나 프레임 구성 단계의 실패. 디스패처가 재시도 대상으로 기록한다.
class PublishError : public std::runtime_error {
 public:
  explicit PublishError(const std::string& message) : std::runtime_error(message) {}
};

class Publisher {
 public:
  Publisher(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);

  // 구독자가 없어도 성공이다. 개별 세션 쓰기 실패는 dropped로만 집계한다.
  DeliveryOutcome Deliver(const OutboxEvent& event);

  // 테스트용: true를 반환하면 해당 이벤트 전달을 실패로 처리한다.
  void SetFailureInjector(const std::function<bool(const OutboxEvent&)>& injector);

 private:
  std::shared_ptr<const std::string> BuildFrame(const OutboxEvent& event) const;

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::function<bool(const OutboxEvent&)> failure_injector_;
};

}  // namespace relay
