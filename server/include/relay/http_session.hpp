/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/메시지 전송 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5, S2, S7)
 * 테스트: server/tests/e2e/realtime_flow_test.cpp, server/tests/e2e/message_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/config.hpp"
#include "relay/connection_registry.hpp"
#include "relay/credentials.hpp"
#include "relay/membership.hpp"
#include "relay/message_service.hpp"
#include "relay/observability.hpp"

namespace relay {

// 요청 대상에서 토큰을 꺼낸다. Authorization: Bearer 우선, 없으면 access_token 쿼리 파라미터.
std::string ExtractAccessToken(const boost::beast::http::request<boost::beast::http::string_body>& req);
std::string UrlDecode(const std::string& text);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<CredentialVerifier> verifier, std::shared_ptr<MembershipChecker> membership,
              std::shared_ptr<MessageService> message_service, std::shared_ptr<ConnectionRegistry> registry,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleSendMessage(const std::shared_ptr<Response>& res, const std::string& conversation_id);
  void Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<CredentialVerifier> verifier_;
  std::shared_ptr<MembershipChecker> membership_;
  std::shared_ptr<MessageService> message_service_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> user_id_;
};

}  // namespace relay
