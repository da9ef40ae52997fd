/*
 * 설명: 실시간 채널의 수신 명령/송신 프레임을 방향별 닫힌 variant로 정의하고 경계에서 변환한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, 6, S5)
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace relay {

inline constexpr int kProtocolVersion = 1;

enum class ErrorCode {
  kUnauthorized,
  kTokenExpired,
  kForbiddenConversation,
  kInvalidCommand,
  kRateLimited,
  kInternalError,
};

std::string_view ToString(ErrorCode code);

class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ErrorCode code, const std::string& message) : std::runtime_error(message), code(code) {}
  ErrorCode code;
};

// 수신 명령
struct SubscribeCommand {
  std::vector<std::string> conversation_ids;
};

struct UnsubscribeCommand {
  std::vector<std::string> conversation_ids;
};

struct PingCommand {
  std::optional<std::int64_t> ts;
};

using ClientCommand = std::variant<SubscribeCommand, UnsubscribeCommand, PingCommand>;

// 크기/JSON/스키마를 검사해 명령으로 변환한다. 실패 시 ProtocolError(kInvalidCommand).
ClientCommand ParseCommand(std::string_view raw, std::size_t max_bytes);
std::string_view CommandName(const ClientCommand& command);

// 송신 프레임
enum class EventType { kMessageCreated, kConversationUpdated };

std::string_view ToString(EventType type);
std::optional<EventType> ParseEventType(std::string_view text);

struct WelcomeFrame {
  std::string connection_id;
  std::string user_id;
  std::chrono::system_clock::time_point server_time;
  std::size_t heartbeat_seconds{0};
  int protocol_version{kProtocolVersion};
};

struct RejectedId {
  std::string conversation_id;
  ErrorCode code;
};

struct AckFrame {
  std::string op;
  bool ok{true};
  std::vector<std::string> accepted;
  std::vector<RejectedId> rejected;
};

struct PongFrame {
  std::optional<std::int64_t> ts;
};

struct ErrorFrame {
  ErrorCode code;
  std::string message;
  nlohmann::json details;
};

struct EventFrame {
  EventType type;
  std::string event_id;
  std::string conversation_id;
  std::uint64_t seq{0};
  std::string occurred_at;
  nlohmann::json payload;
};

using ServerFrame = std::variant<WelcomeFrame, AckFrame, PongFrame, ErrorFrame, EventFrame>;

nlohmann::json ToJson(const ServerFrame& frame);
std::string EncodeFrame(const ServerFrame& frame);

}  // namespace relay
