/*
 * 설명: 실시간 이벤트 아웃박스 행의 기록(쓰기 경로)과 조회/상태 갱신(디스패처)을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (3, 4.2, 4.3)
 * 테스트: server/tests/it/sequencer_it_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mariadb/mysql.h>
#include <nlohmann/json.hpp>

#include "relay/db_client.hpp"

namespace relay {

inline constexpr std::string_view kMessageCreated = "message.created";
inline constexpr std::string_view kConversationUpdated = "conversation.updated";

struct OutboxEvent {
  std::uint64_t id{0};
  std::string event_id;
  std::string event_type;
  std::string conversation_id;
  std::string payload_json;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> published_at;
  std::uint32_t attempts{0};
  std::chrono::system_clock::time_point next_attempt_at;
  std::optional<std::string> last_error;
};

// 저장되는 payload_json 형태: {"seq":..,"occurred_at":..,"payload":{..}}
nlohmann::json MakeEventEnvelope(std::uint64_t seq, std::chrono::system_clock::time_point occurred_at,
                                 const nlohmann::json& payload);

class OutboxWriter {
 public:
  explicit OutboxWriter(std::shared_ptr<MariaDbClient> db_client);

  // 상태 변경과 같은 트랜잭션(conn) 안에서만 호출한다. 전달을 기다리지 않는다.
  std::string Append(MYSQL* conn, const std::string& conversation_id, std::string_view event_type,
                     const nlohmann::json& payload);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

class OutboxRepository {
 public:
  explicit OutboxRepository(std::shared_ptr<MariaDbClient> db_client);

  std::vector<OutboxEvent> FetchDue(MYSQL* conn, std::size_t limit, std::chrono::system_clock::time_point now) const;
  void MarkPublished(MYSQL* conn, std::uint64_t id, std::chrono::system_clock::time_point at) const;
  void MarkFailed(MYSQL* conn, std::uint64_t id, std::uint32_t attempts,
                  std::chrono::system_clock::time_point next_attempt_at, const std::string& error) const;

  std::optional<OutboxEvent> FindByEventId(const std::string& event_id) const;
  std::vector<OutboxEvent> ListByConversation(const std::string& conversation_id) const;

 private:
  std::vector<OutboxEvent> Collect(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  OutboxEvent BuildEvent(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace relay
