/*
 * 설명: 카운터 행을 FOR UPDATE로 잠근 뒤 seq를 배정하고 메시지를 삽입한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.1)
 * 테스트: server/tests/it/sequencer_it_test.cpp
 */
#include "relay/sequencer.hpp"

#include <sstream>

#include "relay/util.hpp"

namespace relay {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr const char* kSeqKey = "uq_conversation_seq";
constexpr const char* kIdempotencyKey = "uq_sender_client_message";

std::uint64_t ToUint64(const char* value) { return value ? std::stoull(value) : 0; }
}  // namespace

Sequencer::Sequencer(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

AllocationResult Sequencer::AllocateAndInsert(MYSQL* conn, const std::string& conversation_id,
                                              const std::string& sender_id, const std::string& client_message_id,
                                              const std::string& content) {
  std::uint64_t next_seq = LockCounter(conn, conversation_id);

  auto existing = FindByIdempotencyKey(conn, sender_id, client_message_id, true);
  if (existing) {
    return AllocationResult{*existing, false};
  }

  MessageRecord record;
  record.id = GenerateUuid();
  record.conversation_id = conversation_id;
  record.sender_id = sender_id;
  record.client_message_id = client_message_id;
  record.seq = next_seq;
  record.content = content;
  record.created_at = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());

  std::ostringstream bump;
  bump << "UPDATE conversation_counters SET next_seq=" << (next_seq + 1)
       << " WHERE conversation_id=" << db_client_->Quote(conn, conversation_id) << ";";
  db_client_->Execute(conn, bump.str(), "카운터 증가 실패");

  std::ostringstream insert;
  insert << "INSERT INTO messages(id, conversation_id, sender_id, client_message_id, seq, content, created_at) VALUES("
         << db_client_->Quote(conn, record.id) << ", " << db_client_->Quote(conn, conversation_id) << ", "
         << db_client_->Quote(conn, sender_id) << ", " << db_client_->Quote(conn, client_message_id) << ", "
         << record.seq << ", " << db_client_->Quote(conn, content) << ", '" << ToDbTimestamp(record.created_at)
         << "');";
  auto sql = insert.str();
  if (mysql_real_query(conn, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      std::string error = mysql_error(conn);
      if (error.find(kSeqKey) != std::string::npos) {
        throw SequenceConflictError("seq 유일성 위반: conversation=" + conversation_id +
                                    " seq=" + std::to_string(record.seq));
      }
      if (error.find(kIdempotencyKey) != std::string::npos) {
        // 다른 대화에서 같은 키가 먼저 커밋되었다. 재시도 시 기존 메시지를 읽는다.
        throw DbException("멱등 키 경합: " + error, kDuplicateEntry, true);
      }
    }
    db_client_->RaiseError(conn, "메시지 저장 실패");
  }
  return AllocationResult{record, true};
}

std::optional<MessageRecord> Sequencer::FindByIdempotencyKey(MYSQL* conn, const std::string& sender_id,
                                                             const std::string& client_message_id,
                                                             bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT id, conversation_id, sender_id, client_message_id, seq, content, created_at FROM messages"
      << " WHERE sender_id=" << db_client_->Quote(conn, sender_id)
      << " AND client_message_id=" << db_client_->Quote(conn, client_message_id)
      << (for_update ? " FOR UPDATE;" : ";");
  auto result = db_client_->Store(conn, oss.str(), "멱등 키 조회 실패");
  MYSQL_ROW row = mysql_fetch_row(result.get());
  if (!row) {
    return std::nullopt;
  }
  return BuildRecord(row);
}

std::uint64_t Sequencer::LockCounter(MYSQL* conn, const std::string& conversation_id) {
  auto quoted = db_client_->Quote(conn, conversation_id);
  db_client_->Execute(conn,
                      "INSERT INTO conversation_counters(conversation_id, next_seq) VALUES(" + quoted +
                          ", 1) ON DUPLICATE KEY UPDATE next_seq=next_seq;",
                      "카운터 생성 실패");
  auto result = db_client_->Store(
      conn, "SELECT next_seq FROM conversation_counters WHERE conversation_id=" + quoted + " FOR UPDATE;",
      "카운터 잠금 실패");
  MYSQL_ROW row = mysql_fetch_row(result.get());
  if (!row) {
    throw DbException("카운터 행이 없습니다: " + conversation_id, 0, false);
  }
  return ToUint64(row[0]);
}

MessageRecord Sequencer::BuildRecord(MYSQL_ROW row) const {
  MessageRecord record;
  record.id = row[0] ? row[0] : "";
  record.conversation_id = row[1] ? row[1] : "";
  record.sender_id = row[2] ? row[2] : "";
  record.client_message_id = row[3] ? row[3] : "";
  record.seq = ToUint64(row[4]);
  record.content = row[5] ? row[5] : "";
  record.created_at = ParseDbTimestamp(row[6] ? row[6] : "1970-01-01 00:00:00");
  return record;
}

}  // namespace relay
