/*
 * 설명: 시간 포맷 변환과 OpenSSL 기반 식별자 생성을 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/util_test.cpp
 */
#include "relay/util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace relay {
namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::vector<unsigned char> RandomBytes(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return buffer;
}

std::tm ToUtcTm(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  return tm;
}

template <typename Duration>
long long FractionOf(std::chrono::system_clock::time_point tp) {
  auto since_epoch = tp.time_since_epoch();
  auto whole = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  if (whole > since_epoch) {
    whole -= std::chrono::seconds(1);
  }
  return std::chrono::duration_cast<Duration>(since_epoch - whole).count();
}
}  // namespace

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  std::tm tm = ToUtcTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0')
      << FractionOf<std::chrono::milliseconds>(tp) << 'Z';
  return oss.str();
}

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp) {
  std::tm tm = ToUtcTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
      << FractionOf<std::chrono::microseconds>(tp);
  return oss.str();
}

std::chrono::system_clock::time_point ParseDbTimestamp(std::string_view text) {
  std::tm tm{};
  std::istringstream iss{std::string(text)};
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    throw std::runtime_error("타임스탬프 형식 오류: " + std::string(text));
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  auto dot = text.find('.');
  if (dot != std::string_view::npos) {
    std::string fraction{text.substr(dot + 1, 6)};
    while (fraction.size() < 6) {
      fraction.push_back('0');
    }
    tp += std::chrono::microseconds(std::stol(fraction));
  }
  return tp;
}

std::string RandomHex(std::size_t bytes) {
  auto buffer = RandomBytes(bytes);
  return BytesToHex(buffer.data(), buffer.size());
}

std::string GenerateUuid() {
  auto buffer = RandomBytes(16);
  // RFC 4122 버전 4, variant 1
  buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0f) | 0x40);
  buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3f) | 0x80);
  auto hex = BytesToHex(buffer.data(), buffer.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
         hex.substr(20, 12);
}

}  // namespace relay
