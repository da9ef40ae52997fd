/*
 * 설명: 아웃박스 행을 삽입하고, 디스패처용 조회와 발행/재시도 상태 갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.2, 4.3)
 * 테스트: server/tests/it/dispatcher_it_test.cpp
 */
#include "relay/outbox.hpp"

#include <sstream>

#include "relay/util.hpp"

namespace relay {
namespace {
constexpr std::size_t kMaxErrorLength = 1000;
constexpr const char* kColumns =
    "id, event_id, event_type, conversation_id, payload_json, created_at, published_at, attempts, next_attempt_at, "
    "last_error";
}  // namespace

nlohmann::json MakeEventEnvelope(std::uint64_t seq, std::chrono::system_clock::time_point occurred_at,
                                 const nlohmann::json& payload) {
  return {{"seq", seq}, {"occurred_at", ToIsoString(occurred_at)}, {"payload", payload}};
}

OutboxWriter::OutboxWriter(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::string OutboxWriter::Append(MYSQL* conn, const std::string& conversation_id, std::string_view event_type,
                                 const nlohmann::json& payload) {
  auto event_id = GenerateUuid();
  auto now = ToDbTimestamp(std::chrono::system_clock::now());
  std::ostringstream oss;
  oss << "INSERT INTO realtime_outbox_events(event_id, event_type, conversation_id, payload_json, created_at, "
         "attempts, next_attempt_at) VALUES("
      << db_client_->Quote(conn, event_id) << ", " << db_client_->Quote(conn, std::string(event_type)) << ", "
      << db_client_->Quote(conn, conversation_id) << ", " << db_client_->Quote(conn, payload.dump()) << ", '" << now
      << "', 0, '" << now << "');";
  db_client_->Execute(conn, oss.str(), "아웃박스 기록 실패");
  return event_id;
}

OutboxRepository::OutboxRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::vector<OutboxEvent> OutboxRepository::FetchDue(MYSQL* conn, std::size_t limit,
                                                    std::chrono::system_clock::time_point now) const {
  std::ostringstream oss;
  oss << "SELECT " << kColumns << " FROM realtime_outbox_events WHERE published_at IS NULL AND next_attempt_at <= '"
      << ToDbTimestamp(now) << "' ORDER BY id ASC LIMIT " << limit << ";";
  return Collect(conn, oss.str(), "대기 이벤트 조회 실패");
}

void OutboxRepository::MarkPublished(MYSQL* conn, std::uint64_t id, std::chrono::system_clock::time_point at) const {
  std::ostringstream oss;
  oss << "UPDATE realtime_outbox_events SET published_at='" << ToDbTimestamp(at) << "', last_error=NULL WHERE id=" << id
      << ";";
  db_client_->Execute(conn, oss.str(), "발행 표시 실패");
}

void OutboxRepository::MarkFailed(MYSQL* conn, std::uint64_t id, std::uint32_t attempts,
                                  std::chrono::system_clock::time_point next_attempt_at,
                                  const std::string& error) const {
  std::ostringstream oss;
  oss << "UPDATE realtime_outbox_events SET attempts=" << attempts << ", next_attempt_at='"
      << ToDbTimestamp(next_attempt_at) << "', last_error=" << db_client_->Quote(conn, error.substr(0, kMaxErrorLength))
      << " WHERE id=" << id << ";";
  db_client_->Execute(conn, oss.str(), "재시도 상태 기록 실패");
}

std::optional<OutboxEvent> OutboxRepository::FindByEventId(const std::string& event_id) const {
  std::optional<OutboxEvent> found;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto events = Collect(conn,
                          std::string("SELECT ") + kColumns + " FROM realtime_outbox_events WHERE event_id=" +
                              db_client_->Quote(conn, event_id) + ";",
                          "이벤트 조회 실패");
    if (!events.empty()) {
      found = events.front();
    }
  });
  return found;
}

std::vector<OutboxEvent> OutboxRepository::ListByConversation(const std::string& conversation_id) const {
  std::vector<OutboxEvent> events;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    events = Collect(conn,
                     std::string("SELECT ") + kColumns + " FROM realtime_outbox_events WHERE conversation_id=" +
                         db_client_->Quote(conn, conversation_id) + " ORDER BY id ASC;",
                     "대화 이벤트 조회 실패");
  });
  return events;
}

std::vector<OutboxEvent> OutboxRepository::Collect(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  auto result = db_client_->Store(conn, sql, ctx);
  std::vector<OutboxEvent> events;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(result.get())) != nullptr) {
    events.push_back(BuildEvent(row));
  }
  return events;
}

OutboxEvent OutboxRepository::BuildEvent(MYSQL_ROW row) const {
  OutboxEvent event;
  event.id = row[0] ? std::stoull(row[0]) : 0;
  event.event_id = row[1] ? row[1] : "";
  event.event_type = row[2] ? row[2] : "";
  event.conversation_id = row[3] ? row[3] : "";
  event.payload_json = row[4] ? row[4] : "";
  event.created_at = ParseDbTimestamp(row[5] ? row[5] : "1970-01-01 00:00:00");
  if (row[6]) {
    event.published_at = ParseDbTimestamp(row[6]);
  }
  event.attempts = row[7] ? static_cast<std::uint32_t>(std::stoul(row[7])) : 0;
  event.next_attempt_at = ParseDbTimestamp(row[8] ? row[8] : "1970-01-01 00:00:00");
  if (row[9]) {
    event.last_error = std::string(row[9]);
  }
  return event;
}

}  // namespace relay
