/*
 * 설명: 고정 윈도우 카운터로 명령 허용 여부를 판단한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (4.5)
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#include "relay/rate_limiter.hpp"

namespace relay {

CommandRateLimiter::CommandRateLimiter(std::size_t max_commands, std::chrono::seconds window)
    : max_commands_(max_commands), window_(window) {}

bool CommandRateLimiter::Allow(std::chrono::steady_clock::time_point now) {
  if (!started_ || now - window_start_ >= window_) {
    started_ = true;
    window_start_ = now;
    count_ = 0;
  }
  if (count_ >= max_commands_) {
    return false;
  }
  ++count_;
  return true;
}

}  // namespace relay
