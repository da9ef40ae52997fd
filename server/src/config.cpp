/*
 * 설명: 환경변수에서 서버 설정을 읽어 AppConfig를 구성한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (A2)
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "relay/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace relay {
namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t GetEnvSize(const char* key, const char* def) {
  auto raw = GetEnv(key, def);
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(raw, &idx);
    if (idx != raw.size()) {
      throw std::invalid_argument(raw);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("환경변수 값이 올바르지 않습니다: ") + key + "=" + raw);
  }
}
unsigned short GetEnvPort(const char* key, const char* def) {
  auto value = GetEnvSize(key, def);
  if (value == 0 || value > std::numeric_limits<unsigned short>::max()) {
    throw std::runtime_error(std::string("환경변수 값이 올바르지 않습니다: ") + key + "=" + GetEnv(key, def));
  }
  return static_cast<unsigned short>(value);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.port = GetEnvPort("SERVER_PORT", "8080");
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = GetEnvPort("DB_PORT", "3306");
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "app_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.auth_token_secret = GetEnv("AUTH_TOKEN_SECRET", "dev-secret-change-me");
  cfg.ws_handshake_timeout_seconds = GetEnvSize("WS_HANDSHAKE_TIMEOUT_SECONDS", "10");
  cfg.ws_idle_timeout_seconds = GetEnvSize("WS_IDLE_TIMEOUT_SECONDS", "60");
  cfg.ws_heartbeat_seconds = GetEnvSize("WS_HEARTBEAT_SECONDS", "25");
  cfg.ws_max_command_bytes = GetEnvSize("WS_MAX_COMMAND_BYTES", "4096");
  cfg.ws_max_read_bytes = GetEnvSize("WS_MAX_READ_BYTES", "65536");
  cfg.ws_rate_window_seconds = GetEnvSize("WS_RATE_WINDOW_SECONDS", "10");
  cfg.ws_rate_max_commands = GetEnvSize("WS_RATE_MAX_COMMANDS", "30");
  cfg.ws_max_subscriptions = GetEnvSize("WS_MAX_SUBSCRIPTIONS", "200");
  cfg.ws_max_ids_per_command = GetEnvSize("WS_MAX_IDS_PER_COMMAND", "100");
  cfg.ws_queue_limit_messages = GetEnvSize("WS_QUEUE_LIMIT_MESSAGES", "256");
  cfg.ws_queue_limit_bytes = GetEnvSize("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.dispatch_interval_ms = GetEnvSize("DISPATCH_INTERVAL_MS", "250");
  cfg.dispatch_batch_size = GetEnvSize("DISPATCH_BATCH_SIZE", "100");
  cfg.dispatch_backoff_base_ms = GetEnvSize("DISPATCH_BACKOFF_BASE_MS", "500");
  cfg.dispatch_backoff_max_ms = GetEnvSize("DISPATCH_BACKOFF_MAX_MS", "30000");
  cfg.message_max_length = GetEnvSize("MESSAGE_MAX_LENGTH", "2000");
  if (cfg.ws_max_read_bytes < cfg.ws_max_command_bytes) {
    cfg.ws_max_read_bytes = cfg.ws_max_command_bytes;
  }
  return cfg;
}

}  // namespace relay
