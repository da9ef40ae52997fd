/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (A3)
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> connection_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t events_published{0};
  std::uint64_t event_failures{0};
  std::uint64_t frames_delivered{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);
  Observability(LogLevel level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementPublished();
  void IncrementEventFailure();
  void AddFramesDelivered(std::uint64_t count);
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= level_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Debug(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kDebug, event, fields);
  }
  void Info(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kInfo, event, fields);
  }
  void Warn(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kWarn, event, fields);
  }
  void Error(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kError, event, fields);
  }

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> events_published_{0};
  std::atomic<std::uint64_t> event_failures_{0};
  std::atomic<std::uint64_t> frames_delivered_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace relay
