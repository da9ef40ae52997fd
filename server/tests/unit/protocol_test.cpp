#include <gtest/gtest.h>

#include "relay/protocol.hpp"

namespace {

constexpr std::size_t kMaxBytes = 4096;

relay::ErrorCode DecodeFailure(const std::string& raw, std::size_t max_bytes = kMaxBytes) {
  try {
    relay::ParseCommand(raw, max_bytes);
  } catch (const relay::ProtocolError& ex) {
    return ex.code;
  }
  ADD_FAILURE() << "디코딩이 성공하면 안 됩니다: " << raw;
  return relay::ErrorCode::kInternalError;
}

}  // namespace

TEST(ProtocolTest, DecodesSubscribeAndDeduplicatesIds) {
  auto command = relay::ParseCommand(R"({"op":"subscribe","conversation_ids":["c2","c1","c2"]})", kMaxBytes);
  auto* subscribe = std::get_if<relay::SubscribeCommand>(&command);
  ASSERT_NE(subscribe, nullptr);
  EXPECT_EQ(subscribe->conversation_ids, (std::vector<std::string>{"c2", "c1"}));
  EXPECT_EQ(relay::CommandName(command), "subscribe");
}

TEST(ProtocolTest, DecodesUnsubscribe) {
  auto command = relay::ParseCommand(R"({"op":"unsubscribe","conversation_ids":["c1"]})", kMaxBytes);
  auto* unsubscribe = std::get_if<relay::UnsubscribeCommand>(&command);
  ASSERT_NE(unsubscribe, nullptr);
  EXPECT_EQ(unsubscribe->conversation_ids, (std::vector<std::string>{"c1"}));
}

TEST(ProtocolTest, DecodesPingWithAndWithoutTs) {
  auto with_ts = relay::ParseCommand(R"({"op":"ping","ts":1700000000123})", kMaxBytes);
  auto* ping = std::get_if<relay::PingCommand>(&with_ts);
  ASSERT_NE(ping, nullptr);
  ASSERT_TRUE(ping->ts.has_value());
  EXPECT_EQ(*ping->ts, 1700000000123LL);

  auto without_ts = relay::ParseCommand(R"({"op":"ping"})", kMaxBytes);
  EXPECT_FALSE(std::get<relay::PingCommand>(without_ts).ts.has_value());

  auto null_ts = relay::ParseCommand(R"({"op":"ping","ts":null})", kMaxBytes);
  EXPECT_FALSE(std::get<relay::PingCommand>(null_ts).ts.has_value());
}

TEST(ProtocolTest, RejectsMalformedInput) {
  EXPECT_EQ(DecodeFailure("not json"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure("[1,2,3]"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"conversation_ids":["c1"]})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":42})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"publish"})"), relay::ErrorCode::kInvalidCommand);
}

TEST(ProtocolTest, RejectsBadConversationIds) {
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe"})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe","conversation_ids":"c1"})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe","conversation_ids":[]})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe","conversation_ids":[""]})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe","conversation_ids":[1]})"), relay::ErrorCode::kInvalidCommand);
}

TEST(ProtocolTest, RejectsUnknownFields) {
  EXPECT_EQ(DecodeFailure(R"({"op":"subscribe","conversation_ids":["c1"],"extra":true})"),
            relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"ping","conversation_ids":["c1"]})"), relay::ErrorCode::kInvalidCommand);
  EXPECT_EQ(DecodeFailure(R"({"op":"ping","ts":"soon"})"), relay::ErrorCode::kInvalidCommand);
}

TEST(ProtocolTest, RejectsOversizedFrame) {
  std::string raw = R"({"op":"ping"})";
  EXPECT_EQ(DecodeFailure(raw, raw.size() - 1), relay::ErrorCode::kInvalidCommand);
  EXPECT_NO_THROW(relay::ParseCommand(raw, raw.size()));
}

TEST(ProtocolTest, ErrorCodeNames) {
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kUnauthorized), "UNAUTHORIZED");
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kTokenExpired), "TOKEN_EXPIRED");
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kForbiddenConversation), "FORBIDDEN_CONVERSATION");
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kInvalidCommand), "INVALID_COMMAND");
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kRateLimited), "RATE_LIMITED");
  EXPECT_EQ(relay::ToString(relay::ErrorCode::kInternalError), "INTERNAL_ERROR");
}

TEST(ProtocolTest, EventTypeNames) {
  auto created = relay::ParseEventType("message.created");
  auto updated = relay::ParseEventType("conversation.updated");
  ASSERT_TRUE(created.has_value());
  ASSERT_TRUE(updated.has_value());
  EXPECT_TRUE(*created == relay::EventType::kMessageCreated);
  EXPECT_TRUE(*updated == relay::EventType::kConversationUpdated);
  EXPECT_EQ(relay::ToString(*created), "message.created");
  EXPECT_FALSE(relay::ParseEventType("message.deleted").has_value());
}

TEST(ProtocolTest, EncodesWelcome) {
  relay::WelcomeFrame welcome{"conn-1", "u1", std::chrono::system_clock::now(), 25, relay::kProtocolVersion};
  auto j = relay::ToJson(welcome);
  EXPECT_EQ(j["type"], "connection.welcome");
  EXPECT_EQ(j["connection_id"], "conn-1");
  EXPECT_EQ(j["user_id"], "u1");
  EXPECT_EQ(j["heartbeat_sec"], 25);
  EXPECT_EQ(j["protocol_version"], 1);
  EXPECT_TRUE(j["server_time"].is_string());
}

TEST(ProtocolTest, EncodesPartialSubscribeAck) {
  relay::AckFrame ack{"subscribe", true, {"c1"}, {relay::RejectedId{"c2", relay::ErrorCode::kForbiddenConversation}}};
  auto j = relay::ToJson(ack);
  EXPECT_EQ(j["type"], "ack");
  EXPECT_EQ(j["op"], "subscribe");
  EXPECT_TRUE(j["ok"].get<bool>());
  EXPECT_EQ(j["accepted"], nlohmann::json::array({"c1"}));
  ASSERT_EQ(j["rejected"].size(), 1u);
  EXPECT_EQ(j["rejected"][0]["conversation_id"], "c2");
  EXPECT_EQ(j["rejected"][0]["code"], "FORBIDDEN_CONVERSATION");
}

TEST(ProtocolTest, EncodesPongAndError) {
  auto pong = relay::ToJson(relay::PongFrame{42});
  EXPECT_EQ(pong["type"], "pong");
  EXPECT_EQ(pong["ts"], 42);
  EXPECT_FALSE(relay::ToJson(relay::PongFrame{}).contains("ts"));

  auto error = relay::ToJson(relay::ErrorFrame{relay::ErrorCode::kRateLimited, "too fast", nullptr});
  EXPECT_EQ(error["type"], "error");
  EXPECT_EQ(error["error"]["code"], "RATE_LIMITED");
  EXPECT_EQ(error["error"]["message"], "too fast");
  EXPECT_FALSE(error["error"].contains("details"));
}

TEST(ProtocolTest, EncodesEventFrame) {
  relay::EventFrame frame{relay::EventType::kMessageCreated, "evt-1", "c1", 1, "2024-01-01T00:00:00.000Z",
                          {{"content", "hi"}}};
  auto decoded = nlohmann::json::parse(relay::EncodeFrame(frame));
  EXPECT_EQ(decoded["type"], "message.created");
  EXPECT_EQ(decoded["event_id"], "evt-1");
  EXPECT_EQ(decoded["conversation_id"], "c1");
  EXPECT_EQ(decoded["seq"], 1);
  EXPECT_EQ(decoded["occurred_at"], "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(decoded["payload"]["content"], "hi");
}
