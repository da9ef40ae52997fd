/*
 * 설명: 세션 등록/해제와 구독 변경을 하나의 뮤텍스로 직렬화하고, 팬아웃은 잠금 밖에서 쓸 스냅샷을 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.4, 5)
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "relay/connection_registry.hpp"

namespace relay {

ConnectionRegistry::ConnectionRegistry(std::size_t max_subscriptions) : max_subscriptions_(max_subscriptions) {}

SessionInfo ConnectionRegistry::Register(const std::string& connection_id, const std::string& user_id,
                                         const std::shared_ptr<ConnectionHandle>& handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.count(connection_id) > 0) {
    throw DuplicateConnectionError(connection_id);
  }
  Session session;
  session.info = SessionInfo{connection_id, user_id, std::chrono::system_clock::now()};
  session.handle = handle;
  auto info = session.info;
  connections_.emplace(connection_id, std::move(session));
  PublishActiveLocked();
  return info;
}

bool ConnectionRegistry::Subscribe(const std::string& connection_id, const std::vector<std::string>& conversation_ids,
                                   std::vector<std::string>& accepted, std::string& error_code,
                                   std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    error_code = "connection_not_found";
    error_message = "등록되지 않은 연결입니다";
    return false;
  }
  auto& session = it->second;
  std::size_t added = 0;
  std::unordered_set<std::string> seen;
  for (const auto& id : conversation_ids) {
    if (session.subscriptions.count(id) == 0 && seen.insert(id).second) {
      ++added;
    }
  }
  if (session.subscriptions.size() + added > max_subscriptions_) {
    error_code = "subscription_limit_exceeded";
    error_message = "구독 한도 초과";
    return false;
  }
  accepted.clear();
  seen.clear();
  for (const auto& id : conversation_ids) {
    if (!seen.insert(id).second) {
      continue;
    }
    session.subscriptions.insert(id);
    subscribers_[id].insert(connection_id);
    accepted.push_back(id);
  }
  return true;
}

void ConnectionRegistry::Unsubscribe(const std::string& connection_id,
                                     const std::vector<std::string>& conversation_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  for (const auto& id : conversation_ids) {
    if (it->second.subscriptions.erase(id) == 0) {
      continue;
    }
    auto sub_it = subscribers_.find(id);
    if (sub_it != subscribers_.end()) {
      sub_it->second.erase(connection_id);
      if (sub_it->second.empty()) {
        subscribers_.erase(sub_it);
      }
    }
  }
}

std::vector<std::shared_ptr<ConnectionHandle>> ConnectionRegistry::Fanout(const std::string& conversation_id) const {
  std::vector<std::shared_ptr<ConnectionHandle>> handles;
  std::lock_guard<std::mutex> lock(mutex_);
  auto sub_it = subscribers_.find(conversation_id);
  if (sub_it == subscribers_.end()) {
    return handles;
  }
  handles.reserve(sub_it->second.size());
  for (const auto& connection_id : sub_it->second) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      continue;
    }
    if (auto handle = it->second.handle.lock()) {
      handles.push_back(std::move(handle));
    }
  }
  return handles;
}

bool ConnectionRegistry::Deregister(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return false;
  }
  DetachLocked(connection_id, it->second);
  connections_.erase(it);
  PublishActiveLocked();
  return true;
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::string> ConnectionRegistry::Subscriptions(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return {};
  }
  return {it->second.subscriptions.begin(), it->second.subscriptions.end()};
}

std::size_t ConnectionRegistry::SubscriberCount(const std::string& conversation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(conversation_id);
  return it == subscribers_.end() ? 0 : it->second.size();
}

std::vector<std::shared_ptr<ConnectionHandle>> ConnectionRegistry::DrainAll() {
  std::vector<std::shared_ptr<ConnectionHandle>> handles;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [connection_id, session] : connections_) {
    if (auto handle = session.handle.lock()) {
      handles.push_back(std::move(handle));
    }
  }
  connections_.clear();
  subscribers_.clear();
  PublishActiveLocked();
  return handles;
}

void ConnectionRegistry::DetachLocked(const std::string& connection_id, Session& session) {
  for (const auto& id : session.subscriptions) {
    auto sub_it = subscribers_.find(id);
    if (sub_it == subscribers_.end()) {
      continue;
    }
    sub_it->second.erase(connection_id);
    if (sub_it->second.empty()) {
      subscribers_.erase(sub_it);
    }
  }
  session.subscriptions.clear();
}

void ConnectionRegistry::PublishActiveLocked() {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace relay
