/*
 * 설명: 팬아웃 스냅샷을 받아 잠금 밖에서 각 세션 송신 큐에 프레임을 적재한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.6, S4)
 * 테스트: server/tests/unit/publisher_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#include "relay/publisher.hpp"

#include "relay/protocol.hpp"

namespace relay {

Publisher::Publisher(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

void Publisher::SetFailureInjector(const std::function<bool(const OutboxEvent&)>& injector) {
  failure_injector_ = injector;
}

DeliveryOutcome Publisher::Deliver(const OutboxEvent& event) {
  if (failure_injector_ && failure_injector_(event)) {
    throw PublishError("주입된 전달 실패");
  }
  auto frame = BuildFrame(event);
  auto handles = registry_->Fanout(event.conversation_id);

  DeliveryOutcome outcome;
  outcome.recipients = handles.size();
  for (const auto& handle : handles) {
    if (handle->SendFrame(frame)) {
      ++outcome.delivered;
      continue;
    }
    ++outcome.dropped;
    registry_->Deregister(handle->ConnectionId());
    handle->ForceClose("send_failed");
    if (observability_) {
      observability_->Warn("publish.session_dropped",
                           {{"connection_id", handle->ConnectionId()}, {"event_id", event.event_id}});
    }
  }
  if (observability_) {
    observability_->AddFramesDelivered(outcome.delivered);
    observability_->Debug("publish.delivered", {{"event_id", event.event_id},
                                                {"conversation_id", event.conversation_id},
                                                {"recipients", outcome.recipients},
                                                {"delivered", outcome.delivered}});
  }
  return outcome;
}

std::shared_ptr<const std::string> Publisher::BuildFrame(const OutboxEvent& event) const {
  auto type = ParseEventType(event.event_type);
  if (!type) {
    throw PublishError("알 수 없는 이벤트 유형: " + event.event_type);
  }
  auto envelope = nlohmann::json::parse(event.payload_json, nullptr, false);
  if (envelope.is_discarded() || !envelope.is_object()) {
    throw PublishError("payload_json 파싱 실패: " + event.event_id);
  }
  auto seq_it = envelope.find("seq");
  auto occurred_it = envelope.find("occurred_at");
  auto payload_it = envelope.find("payload");
  if (seq_it == envelope.end() || !seq_it->is_number_unsigned() || occurred_it == envelope.end() ||
      !occurred_it->is_string() || payload_it == envelope.end() || !payload_it->is_object()) {
    throw PublishError("payload_json 형식 오류: " + event.event_id);
  }
  EventFrame frame{*type,
                   event.event_id,
                   event.conversation_id,
                   seq_it->get<std::uint64_t>(),
                   occurred_it->get<std::string>(),
                   *payload_it};
  return std::make_shared<const std::string>(EncodeFrame(frame));
}

}  // namespace relay
