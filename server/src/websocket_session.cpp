/*
 * 설명: WebSocket 핸드셰이크 후 자격 증명을 검증하고, Open 상태에서 subscribe/unsubscribe/ping을 처리한다.
 *       송신 큐는 디스패처 스레드와 공유하며 넘치면 backpressure_exceeded로 닫는다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, 5, S4, S5)
 * 테스트: server/tests/unit/session_state_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#include "relay/websocket_session.hpp"

#include <chrono>
#include <unordered_set>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "relay/util.hpp"

namespace relay {

namespace websocket = boost::beast::websocket;

namespace {
websocket::close_reason MakeReason(websocket::close_code code, std::string_view text) {
  websocket::close_reason reason{code};
  reason.reason = std::string(text);
  return reason;
}
}  // namespace

std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kConnecting:
      return "connecting";
    case SessionState::kAuthenticating:
      return "authenticating";
    case SessionState::kOpen:
      return "open";
    case SessionState::kClosing:
      return "closing";
    case SessionState::kClosed:
      return "closed";
  }
  return "closed";
}

WebSocketSession::WebSocketSession(boost::beast::tcp_stream stream,
                                   boost::beast::http::request<boost::beast::http::string_body> req,
                                   std::string token, const AppConfig& config,
                                   std::shared_ptr<CredentialVerifier> verifier,
                                   std::shared_ptr<MembershipChecker> membership,
                                   std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<Observability> observability)
    : ws_(std::move(stream)), req_(std::move(req)), idle_timer_(ws_.get_executor()), token_(std::move(token)),
      config_(config), verifier_(std::move(verifier)), membership_(std::move(membership)),
      registry_(std::move(registry)), observability_(std::move(observability)),
      rate_limiter_(config.ws_rate_max_commands, std::chrono::seconds(config.ws_rate_window_seconds)),
      connection_id_(GenerateUuid()) {}

void WebSocketSession::Run() {
  boost::beast::get_lowest_layer(ws_).expires_never();
  websocket::stream_base::timeout opts{};
  opts.handshake_timeout = std::chrono::seconds(config_.ws_handshake_timeout_seconds);
  opts.idle_timeout = websocket::stream_base::none();
  opts.keep_alive_pings = false;
  ws_.set_option(opts);
  ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "chat-relay");
  }));
  ws_.read_message_max(config_.ws_max_read_bytes);
  auto self = shared_from_this();
  ws_.async_accept(req_, [self](boost::beast::error_code ec) { self->OnAccept(ec); });
}

void WebSocketSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    if (observability_) {
      observability_->Warn("ws.accept_failed", {{"connection_id", connection_id_}, {"error", ec.message()}});
    }
    finished_ = true;
    state_ = SessionState::kClosed;
    return;
  }
  state_ = SessionState::kAuthenticating;
  Authenticate();
}

void WebSocketSession::Authenticate() {
  auto result = verifier_->Verify(token_);
  token_.clear();
  if (result.status == CredentialStatus::kExpired) {
    return Reject(ErrorCode::kTokenExpired, "토큰이 만료되었습니다");
  }
  if (result.status != CredentialStatus::kOk) {
    return Reject(ErrorCode::kUnauthorized, "인증이 필요합니다");
  }
  user_id_ = result.user_id;
  try {
    registry_->Register(connection_id_, user_id_, shared_from_this());
  } catch (const DuplicateConnectionError& ex) {
    if (observability_) {
      observability_->Error("ws.register_failed", {{"connection_id", connection_id_}, {"error", ex.what()}});
    }
    SendError(ErrorCode::kInternalError, "연결 등록에 실패했습니다");
    return BeginClose(MakeReason(websocket::close_code::internal_error, "register_failed"), true);
  }
  registered_ = true;
  state_ = SessionState::kOpen;
  if (observability_) {
    observability_->Info("ws.opened", {{"connection_id", connection_id_}, {"user_id", user_id_}});
  }
  Send(WelcomeFrame{connection_id_, user_id_, std::chrono::system_clock::now(), config_.ws_heartbeat_seconds,
                    kProtocolVersion});
  ArmIdleTimer();
  DoRead();
}

void WebSocketSession::Reject(ErrorCode code, const std::string& message) {
  if (observability_) {
    observability_->Info("ws.rejected", {{"connection_id", connection_id_}, {"code", ToString(code)}});
  }
  SendError(code, message);
  BeginClose(MakeReason(websocket::close_code::policy_error, ToString(code)), true);
}

void WebSocketSession::DoRead() {
  if (state_ != SessionState::kOpen) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    Finish(ec == websocket::error::closed ? "client_closed" : ec.message());
    return;
  }
  if (state_ != SessionState::kOpen) {
    return;
  }
  ArmIdleTimer();

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (!ws_.got_text()) {
    SendError(ErrorCode::kInvalidCommand, "텍스트 프레임만 허용됩니다");
  } else if (!rate_limiter_.Allow(std::chrono::steady_clock::now())) {
    SendError(ErrorCode::kRateLimited, "명령 속도 제한을 초과했습니다");
  } else {
    HandleCommand(data);
  }
  DoRead();
}

void WebSocketSession::HandleCommand(const std::string& raw) {
  ClientCommand command;
  try {
    command = ParseCommand(raw, config_.ws_max_command_bytes);
  } catch (const ProtocolError& ex) {
    SendError(ex.code, ex.what());
    return;
  }
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    observability_->Debug("ws.command", {{"connection_id", connection_id_}, {"op", CommandName(command)}});
  }
  if (auto* subscribe = std::get_if<SubscribeCommand>(&command)) {
    HandleSubscribe(*subscribe);
  } else if (auto* unsubscribe = std::get_if<UnsubscribeCommand>(&command)) {
    HandleUnsubscribe(*unsubscribe);
  } else if (auto* ping = std::get_if<PingCommand>(&command)) {
    HandlePing(*ping);
  }
}

void WebSocketSession::HandleSubscribe(const SubscribeCommand& command) {
  if (command.conversation_ids.size() > config_.ws_max_ids_per_command) {
    SendError(ErrorCode::kInvalidCommand, "한 번에 구독할 수 있는 대화 수를 초과했습니다");
    return;
  }
  std::unordered_set<std::string> members;
  try {
    members = membership_->MemberOf(command.conversation_ids, user_id_);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Error("ws.membership_failed", {{"connection_id", connection_id_}, {"error", ex.what()}});
    }
    SendError(ErrorCode::kInternalError, "멤버십 확인에 실패했습니다");
    return;
  }

  std::vector<std::string> allowed;
  AckFrame ack{"subscribe", false, {}, {}};
  for (const auto& id : command.conversation_ids) {
    if (members.count(id) > 0) {
      allowed.push_back(id);
    } else {
      ack.rejected.push_back(RejectedId{id, ErrorCode::kForbiddenConversation});
    }
  }
  if (!allowed.empty()) {
    std::string error_code;
    std::string error_message;
    if (!registry_->Subscribe(connection_id_, allowed, ack.accepted, error_code, error_message)) {
      SendError(ErrorCode::kInvalidCommand, error_message, {{"reason", error_code}});
      return;
    }
  }
  ack.ok = !ack.accepted.empty();
  Send(ack);
  if (!ack.rejected.empty()) {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& rejected : ack.rejected) {
      ids.push_back(rejected.conversation_id);
    }
    SendError(ErrorCode::kForbiddenConversation, "구독 권한이 없는 대화가 있습니다", {{"conversation_ids", ids}});
  }
}

void WebSocketSession::HandleUnsubscribe(const UnsubscribeCommand& command) {
  if (command.conversation_ids.size() > config_.ws_max_ids_per_command) {
    SendError(ErrorCode::kInvalidCommand, "한 번에 해제할 수 있는 대화 수를 초과했습니다");
    return;
  }
  registry_->Unsubscribe(connection_id_, command.conversation_ids);
  Send(AckFrame{"unsubscribe", true, command.conversation_ids, {}});
}

void WebSocketSession::HandlePing(const PingCommand& command) { Send(PongFrame{command.ts}); }

void WebSocketSession::Send(const ServerFrame& frame) {
  SendFrame(std::make_shared<const std::string>(EncodeFrame(frame)));
}

void WebSocketSession::SendError(ErrorCode code, const std::string& message, const nlohmann::json& details) {
  Send(ErrorFrame{code, message, details});
}

bool WebSocketSession::SendFrame(std::shared_ptr<const std::string> frame) {
  bool overflow = false;
  bool start = false;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (closing_) {
      return false;
    }
    if (send_queue_.size() >= config_.ws_queue_limit_messages ||
        queued_bytes_ + frame->size() > config_.ws_queue_limit_bytes) {
      closing_ = true;
      overflow = true;
      send_queue_.clear();
      queued_bytes_ = 0;
    } else {
      queued_bytes_ += frame->size();
      send_queue_.push_back(std::move(frame));
      if (!writing_) {
        writing_ = true;
        start = true;
      }
    }
  }
  auto self = shared_from_this();
  if (overflow) {
    boost::asio::post(ws_.get_executor(), [self]() { self->OnBackpressure(); });
    return false;
  }
  if (start) {
    boost::asio::post(ws_.get_executor(), [self]() { self->WriteNext(); });
  }
  return true;
}

void WebSocketSession::ForceClose(std::string_view reason) {
  auto code = reason == "server_shutdown" ? websocket::close_code::going_away : websocket::close_code::policy_error;
  auto close_reason = MakeReason(code, reason);
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), close_reason]() { self->BeginClose(close_reason, false); });
}

void WebSocketSession::WriteNext() {
  std::shared_ptr<const std::string> frame;
  std::optional<websocket::close_reason> close_now;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (send_queue_.empty() || close_started_) {
      writing_ = false;
      close_now.swap(pending_close_);
    } else {
      frame = send_queue_.front();
      send_queue_.pop_front();
      queued_bytes_ -= frame->size();
    }
  }
  if (!frame) {
    if (close_now) {
      DoClose(*close_now);
    }
    return;
  }
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*frame), [self, frame](boost::beast::error_code ec, std::size_t /*bytes*/) {
    self->OnWrite(ec);
  });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (ec) {
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      closing_ = true;
      writing_ = false;
      send_queue_.clear();
      queued_bytes_ = 0;
    }
    Finish("write_failed");
    return;
  }
  WriteNext();
}

void WebSocketSession::OnBackpressure() {
  if (observability_) {
    observability_->Warn("ws.backpressure", {{"connection_id", connection_id_}, {"user_id", user_id_}});
  }
  BeginClose(MakeReason(websocket::close_code::policy_error, "backpressure_exceeded"), false);
}

void WebSocketSession::ArmIdleTimer() {
  idle_timer_.expires_after(std::chrono::seconds(config_.ws_idle_timeout_seconds));
  auto self = shared_from_this();
  idle_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnIdle(ec); });
}

void WebSocketSession::OnIdle(const boost::system::error_code& ec) {
  if (ec || state_ != SessionState::kOpen) {
    return;
  }
  if (observability_) {
    observability_->Info("ws.idle_timeout", {{"connection_id", connection_id_}, {"user_id", user_id_}});
  }
  BeginClose(MakeReason(websocket::close_code::policy_error, "idle_timeout"), false);
}

void WebSocketSession::BeginClose(websocket::close_reason reason, bool flush) {
  if (state_ == SessionState::kClosing || state_ == SessionState::kClosed) {
    return;
  }
  state_ = SessionState::kClosing;
  idle_timer_.cancel();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closing_ = true;
    if (flush && (writing_ || !send_queue_.empty())) {
      pending_close_ = reason;
      return;
    }
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  DoClose(reason);
}

void WebSocketSession::DoClose(websocket::close_reason reason) {
  if (close_started_) {
    return;
  }
  close_started_ = true;
  auto self = shared_from_this();
  std::string text = std::string(reason.reason.data(), reason.reason.size());
  ws_.async_close(reason, [self, text](boost::beast::error_code) { self->Finish(text); });
}

void WebSocketSession::Finish(const std::string& reason) {
  if (finished_) {
    return;
  }
  finished_ = true;
  auto from_state = state_;
  state_ = SessionState::kClosed;
  idle_timer_.cancel();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closing_ = true;
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  if (registered_) {
    registry_->Deregister(connection_id_);
    registered_ = false;
  }
  if (observability_) {
    observability_->Info("ws.closed", {{"connection_id", connection_id_},
                                       {"user_id", user_id_},
                                       {"from_state", ToString(from_state)},
                                       {"reason", reason}});
  }
}

}  // namespace relay
