#include <sstream>

#include <gtest/gtest.h>

#include "relay/observability.hpp"

TEST(ObservabilityTest, WritesJsonLinesAboveThreshold) {
  std::ostringstream sink;
  relay::Observability observability(relay::LogLevel::kInfo, sink);
  observability.Debug("hidden");
  observability.Warn("dispatcher.publish_failed", {{"event_id", "evt-1"}, {"attempts", 2}});

  std::istringstream lines(sink.str());
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(lines, line)));
  auto entry = nlohmann::json::parse(line);
  EXPECT_EQ(entry["level"], "warn");
  EXPECT_EQ(entry["event"], "dispatcher.publish_failed");
  EXPECT_EQ(entry["event_id"], "evt-1");
  EXPECT_EQ(entry["attempts"], 2);
  EXPECT_TRUE(entry["ts"].is_string());
  EXPECT_FALSE(static_cast<bool>(std::getline(lines, line)));
}

TEST(ObservabilityTest, RequestLogCarriesTraceAndLatency) {
  std::ostringstream sink;
  relay::Observability observability(relay::LogLevel::kInfo, sink);
  observability.Log(relay::LogContext{"trace-1", std::string("u1"), std::nullopt, "/api/health", 12});
  auto entry = nlohmann::json::parse(sink.str());
  EXPECT_EQ(entry["traceId"], "trace-1");
  EXPECT_EQ(entry["userId"], "u1");
  EXPECT_EQ(entry["latencyMs"], 12);
  EXPECT_FALSE(entry.contains("connectionId"));
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream sink;
  relay::Observability observability(relay::LogLevel::kError, sink);
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.IncrementPublished();
  observability.IncrementEventFailure();
  observability.AddFramesDelivered(3);
  observability.SetWebsocketActive(4);
  auto snapshot = observability.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.events_published, 1u);
  EXPECT_EQ(snapshot.event_failures, 1u);
  EXPECT_EQ(snapshot.frames_delivered, 3u);
  EXPECT_EQ(snapshot.websocket_active, 4u);
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(relay::ParseLogLevel("debug"), relay::LogLevel::kDebug);
  EXPECT_EQ(relay::ParseLogLevel("warn"), relay::LogLevel::kWarn);
  EXPECT_EQ(relay::ParseLogLevel("error"), relay::LogLevel::kError);
  EXPECT_EQ(relay::ParseLogLevel("unknown"), relay::LogLevel::kInfo);
}
