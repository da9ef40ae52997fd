/*
 * 설명: 연결 id별 세션과 대화별 구독 인덱스를 하나의 잠금 아래에서 관리하고 팬아웃 스냅샷을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.4, 5)
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "relay/observability.hpp"

namespace relay {

// 레지스트리가 세션 구현을 모른 채 프레임을 밀어 넣기 위한 인터페이스.
class ConnectionHandle {
 public:
  virtual ~ConnectionHandle() = default;
  virtual const std::string& ConnectionId() const = 0;
  // 송신 큐에 적재한다. 세션이 닫히는 중이거나 큐가 넘치면 false.
  virtual bool SendFrame(std::shared_ptr<const std::string> frame) = 0;
  virtual void ForceClose(std::string_view reason) = 0;
};

struct SessionInfo {
  std::string connection_id;
  std::string user_id;
  std::chrono::system_clock::time_point connected_at;
};

class DuplicateConnectionError : public std::runtime_error {
 public:
  explicit DuplicateConnectionError(const std::string& connection_id)
      : std::runtime_error("이미 등록된 연결 id: " + connection_id) {}
};

class ConnectionRegistry {
 public:
  explicit ConnectionRegistry(std::size_t max_subscriptions);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  SessionInfo Register(const std::string& connection_id, const std::string& user_id,
                       const std::shared_ptr<ConnectionHandle>& handle);

  // 멤버십은 호출자가 확인한다. 한도를 넘으면 아무것도 반영하지 않고 false.
  bool Subscribe(const std::string& connection_id, const std::vector<std::string>& conversation_ids,
                 std::vector<std::string>& accepted, std::string& error_code, std::string& error_message);
  void Unsubscribe(const std::string& connection_id, const std::vector<std::string>& conversation_ids);

  std::vector<std::shared_ptr<ConnectionHandle>> Fanout(const std::string& conversation_id) const;

  bool Deregister(const std::string& connection_id);

  std::size_t ActiveConnections() const;
  std::vector<std::string> Subscriptions(const std::string& connection_id) const;
  std::size_t SubscriberCount(const std::string& conversation_id) const;

  // 종료 시 모든 세션 핸들을 꺼내고 비운다.
  std::vector<std::shared_ptr<ConnectionHandle>> DrainAll();

 private:
  struct Session {
    SessionInfo info;
    std::unordered_set<std::string> subscriptions;
    std::weak_ptr<ConnectionHandle> handle;
  };

  void DetachLocked(const std::string& connection_id, Session& session);
  void PublishActiveLocked();

  std::size_t max_subscriptions_;
  std::unordered_map<std::string, Session> connections_;
  std::unordered_map<std::string, std::unordered_set<std::string>> subscribers_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
