/*
 * 설명: 시간 포맷 변환과 식별자 생성 같은 공용 헬퍼를 모은다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/util_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace relay {

// ISO-8601 UTC, 밀리초 포함 (예: 2024-01-01T00:00:00.123Z)
std::string ToIsoString(std::chrono::system_clock::time_point tp);

// MariaDB DATETIME(6) 리터럴 (예: 2024-01-01 00:00:00.123456)
std::string ToDbTimestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point ParseDbTimestamp(std::string_view text);

std::string RandomHex(std::size_t bytes);
std::string GenerateUuid();

}  // namespace relay
