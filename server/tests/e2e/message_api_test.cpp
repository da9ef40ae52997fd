#include "e2e_support.hpp"

namespace {

using boost::beast::http::status;
using relay_test::ExpectErrorEnvelope;
using relay_test::ExpectSuccessEnvelope;

class MessageApiTest : public relay_test::ServerFixture {};

}  // namespace

TEST_F(MessageApiTest, HealthReportsVersion) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
  EXPECT_EQ(res.body["data"]["version"], "v1.0.0");
}

TEST_F(MessageApiTest, UnknownPathIsNotFound) {
  auto res = Get("/api/unknown");
  EXPECT_EQ(res.status, status::not_found);
  ExpectErrorEnvelope(res.body, "not_found");
}

TEST_F(MessageApiTest, SendRequiresValidToken) {
  auto user = UniqueUser("alice");
  auto conversation_id = CreateConversation({user});

  auto missing = SendMessage(conversation_id, "", "m1", "hi");
  EXPECT_EQ(missing.status, status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto expired_token = verifier_->IssueUntil(user, std::chrono::system_clock::now() - std::chrono::seconds(5));
  auto expired = SendMessage(conversation_id, expired_token, "m1", "hi");
  EXPECT_EQ(expired.status, status::unauthorized);
  ExpectErrorEnvelope(expired.body, "token_expired");
}

TEST_F(MessageApiTest, RejectsMalformedBodies) {
  auto user = UniqueUser("bob");
  auto conversation_id = CreateConversation({user});
  auto token = TokenFor(user);
  auto target = "/api/conversations/" + conversation_id + "/messages";

  auto not_json = Request(boost::beast::http::verb::post, target, "{oops", token);
  EXPECT_EQ(not_json.status, status::bad_request);
  ExpectErrorEnvelope(not_json.body, "bad_request");

  auto empty_content = SendMessage(conversation_id, token, "m1", "");
  EXPECT_EQ(empty_content.status, status::bad_request);

  auto long_id = SendMessage(conversation_id, token, std::string(65, 'x'), "hi");
  EXPECT_EQ(long_id.status, status::bad_request);

  auto too_long = SendMessage(conversation_id, token, "m1", std::string(5000, 'a'));
  EXPECT_EQ(too_long.status, status::bad_request);
  ExpectErrorEnvelope(too_long.body, "bad_request");
  EXPECT_TRUE(too_long.body["error"]["detail"].contains("max_length"));
}

TEST_F(MessageApiTest, NonMemberIsForbidden) {
  auto conversation_id = CreateConversation({UniqueUser("owner")});
  auto res = SendMessage(conversation_id, TokenFor(UniqueUser("stranger")), "m1", "hi");
  EXPECT_EQ(res.status, status::forbidden);
  ExpectErrorEnvelope(res.body, "forbidden");
}

TEST_F(MessageApiTest, CreatesThenReplaysIdempotently) {
  auto user = UniqueUser("carol");
  auto conversation_id = CreateConversation({user});
  auto token = TokenFor(user);

  auto created = SendMessage(conversation_id, token, "m1", "hi");
  EXPECT_EQ(created.status, status::created);
  ExpectSuccessEnvelope(created.body);
  const auto& message = created.body["data"];
  EXPECT_EQ(message["conversation_id"], conversation_id);
  EXPECT_EQ(message["sender_id"], user);
  EXPECT_EQ(message["client_message_id"], "m1");
  EXPECT_EQ(message["seq"], 1);
  EXPECT_EQ(message["content"], "hi");
  EXPECT_TRUE(message["id"].is_string());
  EXPECT_TRUE(message["created_at"].is_string());

  auto replay = SendMessage(conversation_id, token, "m1", "hi");
  EXPECT_EQ(replay.status, status::ok);
  EXPECT_EQ(replay.body["data"]["id"], message["id"]);
  EXPECT_EQ(replay.body["data"]["seq"], 1);

  auto second = SendMessage(conversation_id, token, "m2", "again");
  EXPECT_EQ(second.status, status::created);
  EXPECT_EQ(second.body["data"]["seq"], 2);
}

TEST_F(MessageApiTest, MissingConversationIsNotFound) {
  auto user = UniqueUser("dan");
  auto conversation_id = "e2e-missing-" + relay::RandomHex(4);
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "INSERT INTO conversation_members (conversation_id, user_id) VALUES ('" +
                                  conversation_id + "', '" + user + "')",
                        "멤버 추가 실패");
  });
  auto res = SendMessage(conversation_id, TokenFor(user), "m1", "hi");
  EXPECT_EQ(res.status, status::not_found);
  ExpectErrorEnvelope(res.body, "conversation_not_found");
}

TEST_F(MessageApiTest, MetricsCountRequestsAndEvents) {
  auto user = UniqueUser("eve");
  auto conversation_id = CreateConversation({user});
  ASSERT_EQ(SendMessage(conversation_id, TokenFor(user), "m1", "hi").status, status::created);
  std::this_thread::sleep_for(std::chrono::milliseconds(800));

  auto res = Get("/metrics");
  EXPECT_EQ(res.status, status::ok);
  ExpectSuccessEnvelope(res.body);
  const auto& data = res.body["data"];
  EXPECT_GE(data["requests"]["total"].get<std::uint64_t>(), 2u);
  EXPECT_TRUE(data["requests"]["errors"].is_number_unsigned());
  EXPECT_TRUE(data["connections"]["websocket"].is_number_unsigned());
  EXPECT_GE(data["events"]["published"].get<std::uint64_t>(), 2u);
  EXPECT_TRUE(data["events"]["failures"].is_number_unsigned());
  EXPECT_TRUE(data["events"]["framesDelivered"].is_number_unsigned());
}
