/*
 * 설명: 연결별 고정 윈도우 명령 속도 제한.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5)
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>

namespace relay {

// 세션 strand 안에서만 사용하므로 잠금을 두지 않는다.
class CommandRateLimiter {
 public:
  CommandRateLimiter(std::size_t max_commands, std::chrono::seconds window);

  bool Allow(std::chrono::steady_clock::time_point now);
  std::size_t CountInWindow() const { return count_; }

 private:
  std::size_t max_commands_;
  std::chrono::seconds window_;
  std::size_t count_{0};
  std::chrono::steady_clock::time_point window_start_{};
  bool started_{false};
};

}  // namespace relay
