/*
 * 설명: 수신 JSON 명령을 검증/디코딩하고 송신 프레임을 JSON으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, 6)
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "relay/protocol.hpp"

#include <unordered_set>

#include "relay/util.hpp"

namespace relay {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[noreturn]] void Invalid(const std::string& message) { throw ProtocolError(ErrorCode::kInvalidCommand, message); }

void RejectUnknownFields(const nlohmann::json& object, std::initializer_list<std::string_view> allowed) {
  for (auto it = object.begin(); it != object.end(); ++it) {
    bool known = false;
    for (auto name : allowed) {
      if (it.key() == name) {
        known = true;
        break;
      }
    }
    if (!known) {
      Invalid("알 수 없는 필드: " + it.key());
    }
  }
}

std::vector<std::string> ParseConversationIds(const nlohmann::json& object) {
  auto it = object.find("conversation_ids");
  if (it == object.end() || !it->is_array()) {
    Invalid("conversation_ids 배열이 필요합니다");
  }
  std::vector<std::string> ids;
  std::unordered_set<std::string> seen;
  for (const auto& item : *it) {
    if (!item.is_string() || item.get_ref<const std::string&>().empty()) {
      Invalid("conversation_ids에는 비어 있지 않은 문자열만 허용됩니다");
    }
    const auto& id = item.get_ref<const std::string&>();
    if (seen.insert(id).second) {
      ids.push_back(id);
    }
  }
  if (ids.empty()) {
    Invalid("conversation_ids가 비어 있습니다");
  }
  return ids;
}
}  // namespace

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnauthorized:
      return "UNAUTHORIZED";
    case ErrorCode::kTokenExpired:
      return "TOKEN_EXPIRED";
    case ErrorCode::kForbiddenConversation:
      return "FORBIDDEN_CONVERSATION";
    case ErrorCode::kInvalidCommand:
      return "INVALID_COMMAND";
    case ErrorCode::kRateLimited:
      return "RATE_LIMITED";
    case ErrorCode::kInternalError:
      return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

ClientCommand ParseCommand(std::string_view raw, std::size_t max_bytes) {
  if (raw.size() > max_bytes) {
    Invalid("프레임이 너무 큽니다");
  }
  auto decoded = nlohmann::json::parse(raw, nullptr, false);
  if (decoded.is_discarded()) {
    Invalid("JSON 파싱 오류");
  }
  if (!decoded.is_object()) {
    Invalid("명령은 JSON 객체여야 합니다");
  }
  auto op_it = decoded.find("op");
  if (op_it == decoded.end() || !op_it->is_string()) {
    Invalid("op 필드가 필요합니다");
  }
  const auto& op = op_it->get_ref<const std::string&>();
  if (op == "subscribe") {
    RejectUnknownFields(decoded, {"op", "conversation_ids"});
    return SubscribeCommand{ParseConversationIds(decoded)};
  }
  if (op == "unsubscribe") {
    RejectUnknownFields(decoded, {"op", "conversation_ids"});
    return UnsubscribeCommand{ParseConversationIds(decoded)};
  }
  if (op == "ping") {
    RejectUnknownFields(decoded, {"op", "ts"});
    PingCommand ping;
    auto ts_it = decoded.find("ts");
    if (ts_it != decoded.end() && !ts_it->is_null()) {
      if (!ts_it->is_number_integer()) {
        Invalid("ts는 정수여야 합니다");
      }
      ping.ts = ts_it->get<std::int64_t>();
    }
    return ping;
  }
  Invalid("지원하지 않는 명령입니다");
}

std::string_view CommandName(const ClientCommand& command) {
  return std::visit(Overloaded{[](const SubscribeCommand&) { return std::string_view("subscribe"); },
                               [](const UnsubscribeCommand&) { return std::string_view("unsubscribe"); },
                               [](const PingCommand&) { return std::string_view("ping"); }},
                    command);
}

std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kMessageCreated:
      return "message.created";
    case EventType::kConversationUpdated:
      return "conversation.updated";
  }
  return "message.created";
}

std::optional<EventType> ParseEventType(std::string_view text) {
  if (text == "message.created") {
    return EventType::kMessageCreated;
  }
  if (text == "conversation.updated") {
    return EventType::kConversationUpdated;
  }
  return std::nullopt;
}

nlohmann::json ToJson(const ServerFrame& frame) {
  return std::visit(
      Overloaded{
          [](const WelcomeFrame& f) -> nlohmann::json {
            return {{"type", "connection.welcome"},
                    {"connection_id", f.connection_id},
                    {"user_id", f.user_id},
                    {"server_time", ToIsoString(f.server_time)},
                    {"heartbeat_sec", f.heartbeat_seconds},
                    {"protocol_version", f.protocol_version}};
          },
          [](const AckFrame& f) -> nlohmann::json {
            nlohmann::json j{{"type", "ack"}, {"op", f.op}, {"ok", f.ok}, {"accepted", f.accepted}};
            if (!f.rejected.empty()) {
              nlohmann::json rejected = nlohmann::json::array();
              for (const auto& r : f.rejected) {
                rejected.push_back({{"conversation_id", r.conversation_id}, {"code", ToString(r.code)}});
              }
              j["rejected"] = rejected;
            }
            return j;
          },
          [](const PongFrame& f) -> nlohmann::json {
            nlohmann::json j{{"type", "pong"}};
            if (f.ts) {
              j["ts"] = *f.ts;
            }
            return j;
          },
          [](const ErrorFrame& f) -> nlohmann::json {
            nlohmann::json error{{"code", ToString(f.code)}, {"message", f.message}};
            if (!f.details.is_null()) {
              error["details"] = f.details;
            }
            return {{"type", "error"}, {"error", error}};
          },
          [](const EventFrame& f) -> nlohmann::json {
            return {{"type", ToString(f.type)},
                    {"event_id", f.event_id},
                    {"conversation_id", f.conversation_id},
                    {"seq", f.seq},
                    {"occurred_at", f.occurred_at},
                    {"payload", f.payload}};
          }},
      frame);
}

std::string EncodeFrame(const ServerFrame& frame) {
  return ToJson(frame).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace relay
