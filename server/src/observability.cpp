/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (A3)
 */
#include "relay/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

#include "relay/util.hpp"

namespace relay {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

Observability::Observability(LogLevel level) : level_(level), out_(std::cout) {}

Observability::Observability(LogLevel level, std::ostream& out) : level_(level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementPublished() { events_published_.fetch_add(1); }

void Observability::IncrementEventFailure() { event_failures_.fetch_add(1); }

void Observability::AddFramesDelivered(std::uint64_t count) { frames_delivered_.fetch_add(count); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.events_published = events_published_.load();
  snapshot.event_failures = event_failures_.load();
  snapshot.frames_delivered = frames_delivered_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(LogLevel::kInfo);
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["traceId"] = ctx.trace_id;
  log_json["event"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  Write(log_json);
}

void Observability::Log(LogLevel level, std::string_view event, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json{{"detail", fields}};
  log_json["level"] = LevelName(level);
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["event"] = event;
  Write(log_json);
}

void Observability::Write(const nlohmann::json& line) const {
  // 여러 워커 스레드가 동시에 기록하므로 한 줄 단위로 직렬화한다.
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace relay
