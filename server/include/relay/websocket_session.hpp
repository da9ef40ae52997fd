/*
 * 설명: 실시간 WebSocket 연결 하나의 프로토콜 상태 기계. 인증, 구독 명령, 유휴 타임아웃, 송신 백프레셔를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, 5, S4, S5)
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/config.hpp"
#include "relay/connection_registry.hpp"
#include "relay/credentials.hpp"
#include "relay/membership.hpp"
#include "relay/observability.hpp"
#include "relay/protocol.hpp"
#include "relay/rate_limiter.hpp"

namespace relay {

enum class SessionState { kConnecting, kAuthenticating, kOpen, kClosing, kClosed };

std::string_view ToString(SessionState state);

class WebSocketSession : public ConnectionHandle, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::tcp_stream stream, boost::beast::http::request<boost::beast::http::string_body> req,
                   std::string token, const AppConfig& config, std::shared_ptr<CredentialVerifier> verifier,
                   std::shared_ptr<MembershipChecker> membership, std::shared_ptr<ConnectionRegistry> registry,
                   std::shared_ptr<Observability> observability);

  void Run();

  const std::string& ConnectionId() const override { return connection_id_; }
  bool SendFrame(std::shared_ptr<const std::string> frame) override;
  void ForceClose(std::string_view reason) override;

 private:
  void OnAccept(boost::beast::error_code ec);
  void Authenticate();
  void Reject(ErrorCode code, const std::string& message);

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleCommand(const std::string& raw);
  void HandleSubscribe(const SubscribeCommand& command);
  void HandleUnsubscribe(const UnsubscribeCommand& command);
  void HandlePing(const PingCommand& command);

  void Send(const ServerFrame& frame);
  void SendError(ErrorCode code, const std::string& message, const nlohmann::json& details = nullptr);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void OnBackpressure();

  void ArmIdleTimer();
  void OnIdle(const boost::system::error_code& ec);

  void BeginClose(boost::beast::websocket::close_reason reason, bool flush);
  void DoClose(boost::beast::websocket::close_reason reason);
  void Finish(const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  boost::beast::flat_buffer buffer_;
  boost::asio::steady_timer idle_timer_;
  std::string token_;
  AppConfig config_;
  std::shared_ptr<CredentialVerifier> verifier_;
  std::shared_ptr<MembershipChecker> membership_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  CommandRateLimiter rate_limiter_;

  // strand 전용
  SessionState state_{SessionState::kConnecting};
  std::string connection_id_;
  std::string user_id_;
  bool registered_{false};
  bool close_started_{false};
  bool finished_{false};
  std::optional<boost::beast::websocket::close_reason> pending_close_;

  // 다른 스레드(디스패처)에서도 접근하므로 queue_mutex_로 보호한다.
  std::mutex queue_mutex_;
  std::deque<std::shared_ptr<const std::string>> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
};

}  // namespace relay
