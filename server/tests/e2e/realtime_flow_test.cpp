#include "e2e_support.hpp"

namespace {

using relay_test::ExpectWsError;
namespace websocket = boost::beast::websocket;

class RealtimeFlowTest : public relay_test::ServerFixture {};

}  // namespace

TEST_F(RealtimeFlowTest, WelcomeFrameOnConnect) {
  auto user = UniqueUser("alice");
  auto ws = ConnectWs(TokenFor(user));
  boost::beast::flat_buffer buf;
  auto welcome = ReadWs(*ws, buf);
  EXPECT_EQ(welcome["type"], "connection.welcome");
  EXPECT_EQ(welcome["user_id"], user);
  EXPECT_TRUE(welcome["connection_id"].is_string());
  EXPECT_TRUE(welcome["server_time"].is_string());
  EXPECT_TRUE(welcome["heartbeat_sec"].is_number_unsigned());
  EXPECT_TRUE(welcome.contains("protocol_version"));
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, MissingOrForgedTokenIsRejected) {
  for (const std::string& token : {std::string(), std::string("alice.9999999999.deadbeef")}) {
    auto ws = ConnectWs(token);
    boost::beast::flat_buffer buf;
    auto error = ReadWs(*ws, buf);
    ExpectWsError(error, "UNAUTHORIZED");
    auto reason = ReadUntilClosed(*ws, buf);
    EXPECT_EQ(reason.code, websocket::close_code::policy_error);
  }
}

TEST_F(RealtimeFlowTest, ExpiredTokenIsRejected) {
  auto token = verifier_->IssueUntil(UniqueUser("late"), std::chrono::system_clock::now() - std::chrono::seconds(10));
  auto ws = ConnectWs(token);
  boost::beast::flat_buffer buf;
  ExpectWsError(ReadWs(*ws, buf), "TOKEN_EXPIRED");
  ReadUntilClosed(*ws, buf);
}

TEST_F(RealtimeFlowTest, SubscribeThenReceiveMessageCreated) {
  auto alice = UniqueUser("alice");
  auto bob = UniqueUser("bob");
  auto conversation_id = CreateConversation({alice, bob});

  auto ws = ConnectWs(TokenFor(bob));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");
  WriteWs(*ws, {{"op", "subscribe"}, {"conversation_ids", {conversation_id}}});
  auto ack = ReadUntil(*ws, buf, "ack");
  EXPECT_EQ(ack["op"], "subscribe");
  EXPECT_TRUE(ack["ok"].get<bool>());
  EXPECT_EQ(ack["accepted"], nlohmann::json::array({conversation_id}));
  EXPECT_FALSE(ack.contains("rejected"));

  auto sent = SendMessage(conversation_id, TokenFor(alice), "m1", "hi");
  ASSERT_EQ(sent.status, boost::beast::http::status::created);

  auto event = ReadUntil(*ws, buf, "message.created");
  ASSERT_TRUE(event.is_object());
  EXPECT_EQ(event["conversation_id"], conversation_id);
  EXPECT_EQ(event["seq"], 1);
  EXPECT_EQ(event["payload"]["content"], "hi");
  EXPECT_EQ(event["payload"]["sender_id"], alice);
  EXPECT_TRUE(event["event_id"].is_string());
  EXPECT_TRUE(event["occurred_at"].is_string());

  auto updated = ReadUntil(*ws, buf, "conversation.updated");
  EXPECT_EQ(updated["seq"], 1);
  EXPECT_EQ(updated["payload"]["last_message_preview"], "hi");
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, PartialSubscribeRejectsForeignConversations) {
  auto user = UniqueUser("carol");
  auto mine = CreateConversation({user});
  auto foreign = CreateConversation({UniqueUser("dave")});

  auto ws = ConnectWs(TokenFor(user));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");
  WriteWs(*ws, {{"op", "subscribe"}, {"conversation_ids", {mine, foreign}}});

  auto ack = ReadUntil(*ws, buf, "ack");
  EXPECT_TRUE(ack["ok"].get<bool>());
  EXPECT_EQ(ack["accepted"], nlohmann::json::array({mine}));
  ASSERT_EQ(ack["rejected"].size(), 1u);
  EXPECT_EQ(ack["rejected"][0]["conversation_id"], foreign);
  EXPECT_EQ(ack["rejected"][0]["code"], "FORBIDDEN_CONVERSATION");

  auto error = ReadWs(*ws, buf);
  ExpectWsError(error, "FORBIDDEN_CONVERSATION");
  EXPECT_EQ(error["error"]["details"]["conversation_ids"], nlohmann::json::array({foreign}));

  WriteWs(*ws, {{"op", "subscribe"}, {"conversation_ids", {foreign}}});
  auto denied = ReadUntil(*ws, buf, "ack");
  EXPECT_FALSE(denied["ok"].get<bool>());
  EXPECT_TRUE(denied["accepted"].empty());
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, UnsubscribedConversationIsSilent) {
  auto user = UniqueUser("erin");
  auto conversation_id = CreateConversation({user});
  auto ws = ConnectWs(TokenFor(user));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");
  WriteWs(*ws, {{"op", "subscribe"}, {"conversation_ids", {conversation_id}}});
  ReadUntil(*ws, buf, "ack");
  WriteWs(*ws, {{"op", "unsubscribe"}, {"conversation_ids", {conversation_id}}});
  auto ack = ReadUntil(*ws, buf, "ack");
  EXPECT_EQ(ack["op"], "unsubscribe");
  EXPECT_TRUE(ack["ok"].get<bool>());

  ASSERT_EQ(SendMessage(conversation_id, TokenFor(user), "quiet", "hello").status,
            boost::beast::http::status::created);
  std::this_thread::sleep_for(std::chrono::milliseconds(800));
  WriteWs(*ws, {{"op", "ping"}, {"ts", 7}});
  // 구독 해제 후에는 이벤트 없이 pong이 바로 와야 한다.
  auto next = ReadWs(*ws, buf);
  EXPECT_EQ(next["type"], "pong");
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, PingEchoesTimestamp) {
  auto ws = ConnectWs(TokenFor(UniqueUser("frank")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");
  WriteWs(*ws, {{"op", "ping"}, {"ts", 1234}});
  auto pong = ReadWs(*ws, buf);
  EXPECT_EQ(pong["type"], "pong");
  EXPECT_EQ(pong["ts"], 1234);
  WriteWs(*ws, {{"op", "ping"}});
  auto bare = ReadWs(*ws, buf);
  EXPECT_EQ(bare["type"], "pong");
  EXPECT_FALSE(bare.contains("ts"));
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, InvalidCommandKeepsConnectionOpen) {
  auto ws = ConnectWs(TokenFor(UniqueUser("gina")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");

  ws->write(boost::asio::buffer(std::string("not json")));
  ExpectWsError(ReadWs(*ws, buf), "INVALID_COMMAND");
  WriteWs(*ws, {{"op", "teleport"}});
  ExpectWsError(ReadWs(*ws, buf), "INVALID_COMMAND");
  WriteWs(*ws, {{"op", "subscribe"}, {"conversation_ids", nlohmann::json::array()}});
  ExpectWsError(ReadWs(*ws, buf), "INVALID_COMMAND");

  WriteWs(*ws, {{"op", "ping"}, {"ts", 1}});
  EXPECT_EQ(ReadWs(*ws, buf)["type"], "pong");
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, CommandFloodIsRateLimited) {
  auto ws = ConnectWs(TokenFor(UniqueUser("hank")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");

  constexpr int kCommands = 200;
  for (int i = 0; i < kCommands; ++i) {
    WriteWs(*ws, {{"op", "ping"}, {"ts", i}});
  }
  bool limited = false;
  for (int i = 0; i < kCommands; ++i) {
    auto msg = ReadWs(*ws, buf);
    if (msg["type"] == "error") {
      ExpectWsError(msg, "RATE_LIMITED");
      limited = true;
      break;
    }
  }
  EXPECT_TRUE(limited);
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, IdleConnectionIsClosed) {
  const char* idle_env = std::getenv("E2E_IDLE_TIMEOUT_SECONDS");
  if (!idle_env) {
    GTEST_SKIP() << "E2E_IDLE_TIMEOUT_SECONDS가 설정되지 않았습니다";
  }
  auto ws = ConnectWs(TokenFor(UniqueUser("ivy")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");
  auto started = std::chrono::steady_clock::now();
  auto reason = ReadUntilClosed(*ws, buf);
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_EQ(std::string(reason.reason.data(), reason.reason.size()), "idle_timeout");
  EXPECT_GE(elapsed, std::chrono::seconds(std::stoi(idle_env)) - std::chrono::milliseconds(500));
}

TEST_F(RealtimeFlowTest, PingsKeepIdleConnectionOpen) {
  const char* idle_env = std::getenv("E2E_IDLE_TIMEOUT_SECONDS");
  if (!idle_env) {
    GTEST_SKIP() << "E2E_IDLE_TIMEOUT_SECONDS가 설정되지 않았습니다";
  }
  const auto window = std::chrono::milliseconds(std::stoi(idle_env) * 1000);
  auto ws = ConnectWs(TokenFor(UniqueUser("jack")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");

  // 창의 절반 간격으로 창 세 개 분량만큼 ping을 보낸다.
  const auto interval = window / 2;
  for (int i = 0; i < 6; ++i) {
    std::this_thread::sleep_for(interval);
    WriteWs(*ws, {{"op", "ping"}, {"ts", i}});
    auto pong = ReadWs(*ws, buf);
    ASSERT_EQ(pong["type"], "pong") << i << "번째 ping 이후 연결이 유지되어야 합니다";
    EXPECT_EQ(pong["ts"], i);
  }

  auto stopped = std::chrono::steady_clock::now();
  auto reason = ReadUntilClosed(*ws, buf);
  EXPECT_EQ(std::string(reason.reason.data(), reason.reason.size()), "idle_timeout");
  EXPECT_GE(std::chrono::steady_clock::now() - stopped, window - std::chrono::milliseconds(500));
}

TEST_F(RealtimeFlowTest, FrameOverCommandLimitKeepsConnectionOpen) {
  auto ws = ConnectWs(TokenFor(UniqueUser("kate")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");

  nlohmann::json big{{"op", "ping"}, {"ts", 1}, {"pad", std::string(8192, 'x')}};
  WriteWs(*ws, big);
  ExpectWsError(ReadWs(*ws, buf), "INVALID_COMMAND");
  WriteWs(*ws, {{"op", "ping"}, {"ts", 2}});
  EXPECT_EQ(ReadWs(*ws, buf)["type"], "pong");
  ws->close(websocket::close_code::normal);
}

TEST_F(RealtimeFlowTest, FrameOverTransportCapClosesWithTooBig) {
  const char* cap_env = std::getenv("E2E_MAX_READ_BYTES");
  const std::size_t cap = cap_env ? static_cast<std::size_t>(std::stoul(cap_env)) : 65536;
  auto ws = ConnectWs(TokenFor(UniqueUser("liam")));
  boost::beast::flat_buffer buf;
  ReadUntil(*ws, buf, "connection.welcome");

  std::string oversized(cap + 1024, 'x');
  boost::beast::error_code ec;
  ws->write(boost::asio::buffer(oversized), ec);
  auto reason = ReadUntilClosed(*ws, buf);
  EXPECT_EQ(reason.code, websocket::close_code::too_big);
}
