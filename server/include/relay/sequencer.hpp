/*
 * 설명: 대화별 순번(seq)을 카운터 행 잠금으로 할당하고 메시지를 멱등하게 저장한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.1)
 * 테스트: server/tests/it/sequencer_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "relay/db_client.hpp"

namespace relay {

struct MessageRecord {
  std::string id;
  std::string conversation_id;
  std::string sender_id;
  std::string client_message_id;
  std::uint64_t seq{0};
  std::string content;
  std::chrono::system_clock::time_point created_at;
};

struct AllocationResult {
  MessageRecord message;
  bool is_new{false};
};

// (conversation_id, seq) 유일성 위반. 잠금이 깨졌다는 뜻이므로 재시도하지 않고 트랜잭션을 중단한다.
class SequenceConflictError : public DbException {
 public:
  explicit SequenceConflictError(const std::string& message) : DbException(message, 1062, false) {}
};

class Sequencer {
 public:
  explicit Sequencer(std::shared_ptr<MariaDbClient> db_client);

  // 진행 중인 트랜잭션(conn) 안에서만 호출한다.
  AllocationResult AllocateAndInsert(MYSQL* conn, const std::string& conversation_id, const std::string& sender_id,
                                     const std::string& client_message_id, const std::string& content);

  std::optional<MessageRecord> FindByIdempotencyKey(MYSQL* conn, const std::string& sender_id,
                                                    const std::string& client_message_id, bool for_update) const;

 private:
  std::uint64_t LockCounter(MYSQL* conn, const std::string& conversation_id);
  MessageRecord BuildRecord(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace relay
