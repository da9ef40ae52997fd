/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/메시지 전송/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, S2, S7)
 * 테스트: server/tests/e2e/realtime_flow_test.cpp, server/tests/e2e/message_api_test.cpp
 */
#include "relay/http_session.hpp"

#include <cctype>
#include <chrono>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "relay/api_response.hpp"
#include "relay/sequencer.hpp"
#include "relay/util.hpp"
#include "relay/websocket_session.hpp"

namespace relay {

namespace {
constexpr std::size_t kMaxClientMessageIdLength = 64;
constexpr std::string_view kConversationsPrefix = "/api/conversations/";
constexpr std::string_view kMessagesSuffix = "/messages";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::size_t Utf8Length(const std::string& text) {
  std::size_t chars = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++chars;
    }
  }
  return chars;
}

// "/api/conversations/{id}/messages" 형태면 id를 돌려준다.
std::optional<std::string> MatchMessagesPath(const std::string& path) {
  if (path.size() <= kConversationsPrefix.size() + kMessagesSuffix.size() ||
      path.compare(0, kConversationsPrefix.size(), kConversationsPrefix) != 0 ||
      path.compare(path.size() - kMessagesSuffix.size(), kMessagesSuffix.size(), kMessagesSuffix) != 0) {
    return std::nullopt;
  }
  auto id = path.substr(kConversationsPrefix.size(),
                        path.size() - kConversationsPrefix.size() - kMessagesSuffix.size());
  if (id.empty() || id.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return UrlDecode(id);
}

nlohmann::json MessageToJson(const MessageRecord& message) {
  return {{"id", message.id},
          {"conversation_id", message.conversation_id},
          {"sender_id", message.sender_id},
          {"client_message_id", message.client_message_id},
          {"seq", message.seq},
          {"content", message.content},
          {"created_at", ToIsoString(message.created_at)}};
}
}  // namespace

std::string UrlDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string ExtractAccessToken(const boost::beast::http::request<boost::beast::http::string_body>& req) {
  auto auth_it = req.find(boost::beast::http::field::authorization);
  if (auth_it != req.end()) {
    const std::string prefix = "Bearer ";
    std::string value(auth_it->value());
    if (value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0) {
      return value.substr(prefix.size());
    }
  }
  std::string target(req.target());
  auto qpos = target.find('?');
  if (qpos == std::string::npos) {
    return "";
  }
  auto params = ParseQueryParams(target.substr(qpos + 1));
  auto it = params.find("access_token");
  return it == params.end() ? std::string() : it->second;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<CredentialVerifier> verifier, std::shared_ptr<MembershipChecker> membership,
                         std::shared_ptr<MessageService> message_service, std::shared_ptr<ConnectionRegistry> registry,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), verifier_(std::move(verifier)), membership_(std::move(membership)),
      message_service_(std::move(message_service)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  // 업그레이드 요청까지 포함한 핸드셰이크 예산
  stream_.expires_after(std::chrono::seconds(config_.ws_handshake_timeout_seconds));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  std::string target(req_.target());
  if (boost::beast::websocket::is_upgrade(req_) && target.substr(0, target.find('?')) == "/ws") {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  user_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "chat-relay");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"events",
                         {{"published", snapshot.events_published},
                          {"failures", snapshot.event_failures},
                          {"framesDelivered", snapshot.frames_delivered}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post) {
    if (auto conversation_id = MatchMessagesPath(path)) {
      return HandleSendMessage(res, *conversation_id);
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleSendMessage(const std::shared_ptr<Response>& res, const std::string& conversation_id) {
  using boost::beast::http::status;
  auto credential = verifier_->Verify(ExtractAccessToken(req_));
  if (credential.status == CredentialStatus::kExpired) {
    return Reply(res, status::unauthorized, MakeErrorEnvelope("token_expired", "토큰이 만료되었습니다"));
  }
  if (credential.status != CredentialStatus::kOk) {
    return Reply(res, status::unauthorized, MakeErrorEnvelope("unauthorized", "인증이 필요합니다"));
  }
  user_id_ = credential.user_id;

  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("client_message_id") ||
      !body.contains("content") || !body["client_message_id"].is_string() || !body["content"].is_string()) {
    return Reply(res, status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  }
  auto client_message_id = body["client_message_id"].get<std::string>();
  auto content = body["content"].get<std::string>();
  if (client_message_id.empty() || client_message_id.size() > kMaxClientMessageIdLength) {
    return Reply(res, status::bad_request,
                 MakeErrorEnvelope("bad_request", "client_message_id 길이가 올바르지 않습니다"));
  }
  if (content.empty() || Utf8Length(content) > config_.message_max_length) {
    return Reply(res, status::bad_request, MakeErrorEnvelope("bad_request", "content 길이가 올바르지 않습니다",
                                                             {{"max_length", config_.message_max_length}}));
  }

  try {
    if (!membership_->IsMember(conversation_id, credential.user_id)) {
      return Reply(res, status::forbidden, MakeErrorEnvelope("forbidden", "대화 멤버가 아닙니다"));
    }
    auto result = message_service_->Send(conversation_id, credential.user_id, client_message_id, content);
    Reply(res, result.created ? status::created : status::ok, MakeSuccessEnvelope(MessageToJson(result.message)));
  } catch (const WritePathError& ex) {
    auto code = ex.code == "conversation_not_found" ? status::not_found : status::conflict;
    Reply(res, code, MakeErrorEnvelope(ex.code, ex.what()));
  } catch (const SequenceConflictError& ex) {
    if (observability_) {
      observability_->Error("message.sequence_conflict", {{"conversation_id", conversation_id}, {"error", ex.what()}});
    }
    Reply(res, status::conflict, MakeErrorEnvelope("sequence_conflict", "메시지 순번 충돌"));
  } catch (const DbException& ex) {
    if (observability_) {
      observability_->Error("message.send_failed",
                            {{"conversation_id", conversation_id}, {"code", ex.code}, {"error", ex.what()}});
    }
    Reply(res, status::internal_server_error, MakeErrorEnvelope("internal_error", "메시지 저장에 실패했습니다"));
  }
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                        const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count();
    std::string target(req_.target());
    observability_->Log(
        LogContext{trace_id_, user_id_, std::nullopt, target.substr(0, target.find('?')), static_cast<long>(latency)});
  }
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  // 자격 증명 검증은 핸드셰이크 뒤에 세션이 수행하고, 실패는 error 프레임과 close로 알린다.
  auto token = ExtractAccessToken(req_);
  std::make_shared<WebSocketSession>(std::move(stream_), std::move(req_), std::move(token), config_, verifier_,
                                     membership_, registry_, observability_)
      ->Run();
}

}  // namespace relay
