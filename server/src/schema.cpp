/*
 * 설명: CREATE TABLE IF NOT EXISTS로 스키마를 멱등하게 생성한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S1)
 */
#include "relay/schema.hpp"

namespace relay {
namespace {
// conversations/conversation_members는 대화 CRUD가 소유하며 여기서는 참조용으로만 보장한다.
constexpr const char* kStatements[] = {
    "CREATE TABLE IF NOT EXISTS conversations ("
    " id VARCHAR(64) NOT NULL PRIMARY KEY,"
    " updated_at DATETIME(6) NOT NULL,"
    " last_message_preview VARCHAR(280) NULL,"
    " last_message_at DATETIME(6) NULL"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS conversation_members ("
    " conversation_id VARCHAR(64) NOT NULL,"
    " user_id VARCHAR(64) NOT NULL,"
    " PRIMARY KEY (conversation_id, user_id),"
    " KEY idx_members_user (user_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS conversation_counters ("
    " conversation_id VARCHAR(64) NOT NULL PRIMARY KEY,"
    " next_seq BIGINT UNSIGNED NOT NULL DEFAULT 1"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS messages ("
    " id CHAR(36) NOT NULL PRIMARY KEY,"
    " conversation_id VARCHAR(64) NOT NULL,"
    " sender_id VARCHAR(64) NOT NULL,"
    " client_message_id VARCHAR(64) NOT NULL,"
    " seq BIGINT UNSIGNED NOT NULL,"
    " content TEXT NOT NULL,"
    " created_at DATETIME(6) NOT NULL,"
    " UNIQUE KEY uq_sender_client_message (sender_id, client_message_id),"
    " UNIQUE KEY uq_conversation_seq (conversation_id, seq)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS realtime_outbox_events ("
    " id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " event_id CHAR(36) NOT NULL,"
    " event_type VARCHAR(64) NOT NULL,"
    " conversation_id VARCHAR(64) NOT NULL,"
    " payload_json MEDIUMTEXT NOT NULL,"
    " created_at DATETIME(6) NOT NULL,"
    " published_at DATETIME(6) NULL,"
    " attempts INT UNSIGNED NOT NULL DEFAULT 0,"
    " next_attempt_at DATETIME(6) NOT NULL,"
    " last_error TEXT NULL,"
    " UNIQUE KEY uq_outbox_event_id (event_id),"
    " KEY idx_outbox_pending (published_at, next_attempt_at, id),"
    " KEY idx_outbox_conversation (conversation_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
};
}  // namespace

void EnsureSchema(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    for (const char* statement : kStatements) {
      db_client.Execute(conn, statement, "스키마 생성 실패");
    }
  });
}

}  // namespace relay
