/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (A2)
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace relay {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string auth_token_secret;
  std::size_t ws_handshake_timeout_seconds;
  std::size_t ws_idle_timeout_seconds;
  std::size_t ws_heartbeat_seconds;
  std::size_t ws_max_command_bytes;
  std::size_t ws_max_read_bytes;
  std::size_t ws_rate_window_seconds;
  std::size_t ws_rate_max_commands;
  std::size_t ws_max_subscriptions;
  std::size_t ws_max_ids_per_command;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t dispatch_interval_ms;
  std::size_t dispatch_batch_size;
  std::size_t dispatch_backoff_base_ms;
  std::size_t dispatch_backoff_max_ms;
  std::size_t message_max_length;
};

AppConfig LoadConfigFromEnv();

}  // namespace relay
