/*
 * 설명: 메시지 저장(Sequencer)과 아웃박스 기록(OutboxWriter)을 단일 트랜잭션으로 묶는 쓰기 경로.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.1, 4.2, S2)
 * 테스트: server/tests/it/sequencer_it_test.cpp
 */
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "relay/db_client.hpp"
#include "relay/outbox.hpp"
#include "relay/sequencer.hpp"

namespace relay {

// 호출자에게 그대로 보여줄 쓰기 경로 오류. code는 HTTP 응답 코드로 매핑된다.
class WritePathError : public std::runtime_error {
 public:
  WritePathError(std::string code, const std::string& message) : std::runtime_error(message), code(std::move(code)) {}
  std::string code;
};

struct SendResult {
  MessageRecord message;
  bool created{false};
};

class MessageService {
 public:
  MessageService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Sequencer> sequencer,
                 std::shared_ptr<OutboxWriter> outbox_writer);

  SendResult Send(const std::string& conversation_id, const std::string& sender_id,
                  const std::string& client_message_id, const std::string& content);

 private:
  void EnsureConversation(MYSQL* conn, const std::string& conversation_id);
  nlohmann::json TouchConversation(MYSQL* conn, const MessageRecord& message);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Sequencer> sequencer_;
  std::shared_ptr<OutboxWriter> outbox_writer_;
};

}  // namespace relay
