/*
 * 설명: 메시지 삽입, 대화 메타데이터 갱신, 두 개의 아웃박스 이벤트 기록을 한 트랜잭션으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S2)
 * 테스트: server/tests/it/sequencer_it_test.cpp
 */
#include "relay/message_service.hpp"

#include <sstream>

#include "relay/util.hpp"

namespace relay {
namespace {
constexpr std::size_t kPreviewMaxChars = 280;

// UTF-8 코드포인트 단위로 자른다.
std::string Utf8Prefix(const std::string& text, std::size_t max_chars) {
  std::size_t chars = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    if ((lead & 0xC0) != 0x80) {
      if (chars == max_chars) {
        break;
      }
      ++chars;
    }
    ++i;
  }
  return text.substr(0, i);
}
}  // namespace

MessageService::MessageService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Sequencer> sequencer,
                               std::shared_ptr<OutboxWriter> outbox_writer)
    : db_client_(std::move(db_client)), sequencer_(std::move(sequencer)), outbox_writer_(std::move(outbox_writer)) {}

SendResult MessageService::Send(const std::string& conversation_id, const std::string& sender_id,
                                const std::string& client_message_id, const std::string& content) {
  SendResult result;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    EnsureConversation(conn, conversation_id);
    auto allocation = sequencer_->AllocateAndInsert(conn, conversation_id, sender_id, client_message_id, content);
    result = SendResult{allocation.message, allocation.is_new};
    if (!allocation.is_new) {
      if (allocation.message.conversation_id != conversation_id) {
        throw WritePathError("client_message_conflict", "client_message_id가 다른 대화에서 이미 사용되었습니다");
      }
      return true;
    }

    const auto& message = allocation.message;
    nlohmann::json message_payload{{"id", message.id},
                                   {"sender_id", message.sender_id},
                                   {"client_message_id", message.client_message_id},
                                   {"content", message.content},
                                   {"created_at", ToIsoString(message.created_at)}};
    outbox_writer_->Append(conn, conversation_id, kMessageCreated,
                           MakeEventEnvelope(message.seq, message.created_at, message_payload));

    auto conversation_payload = TouchConversation(conn, message);
    outbox_writer_->Append(conn, conversation_id, kConversationUpdated,
                           MakeEventEnvelope(message.seq, message.created_at, conversation_payload));
    return true;
  });
  return result;
}

void MessageService::EnsureConversation(MYSQL* conn, const std::string& conversation_id) {
  auto res = db_client_->Store(conn, "SELECT id FROM conversations WHERE id=" + db_client_->Quote(conn, conversation_id) + ";",
                               "대화 조회 실패");
  if (!mysql_fetch_row(res.get())) {
    throw WritePathError("conversation_not_found", "대화를 찾을 수 없습니다");
  }
}

nlohmann::json MessageService::TouchConversation(MYSQL* conn, const MessageRecord& message) {
  auto preview = Utf8Prefix(message.content, kPreviewMaxChars);
  auto at = ToDbTimestamp(message.created_at);
  std::ostringstream oss;
  oss << "UPDATE conversations SET updated_at='" << at << "', last_message_at='" << at
      << "', last_message_preview=" << db_client_->Quote(conn, preview)
      << " WHERE id=" << db_client_->Quote(conn, message.conversation_id) << ";";
  db_client_->Execute(conn, oss.str(), "대화 메타데이터 갱신 실패");
  return {{"id", message.conversation_id},
          {"updated_at", ToIsoString(message.created_at)},
          {"last_message_preview", preview},
          {"last_message_at", ToIsoString(message.created_at)}};
}

}  // namespace relay
