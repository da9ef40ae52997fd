/*
 * 설명: OpenSSL HMAC-SHA256으로 토큰 서명을 만들고 상수 시간 비교로 검증한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S3)
 * 테스트: server/tests/unit/credentials_test.cpp
 */
#include "relay/credentials.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace relay {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool ParseUnixSeconds(const std::string& text, long long& out) {
  if (text.empty() || text.size() > 18) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  out = std::stoll(text);
  return true;
}
}  // namespace

HmacCredentialVerifier::HmacCredentialVerifier(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    throw std::invalid_argument("토큰 서명 키가 비어 있습니다");
  }
}

CredentialResult HmacCredentialVerifier::Verify(const std::string& token) const {
  CredentialResult result;
  auto sig_dot = token.rfind('.');
  if (sig_dot == std::string::npos || sig_dot == 0) {
    return result;
  }
  auto exp_dot = token.rfind('.', sig_dot - 1);
  if (exp_dot == std::string::npos || exp_dot == 0) {
    return result;
  }
  std::string user_id = token.substr(0, exp_dot);
  std::string expires_text = token.substr(exp_dot + 1, sig_dot - exp_dot - 1);
  std::string signature = token.substr(sig_dot + 1);

  auto expected = Sign(token.substr(0, sig_dot));
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    return result;
  }
  long long expires_unix = 0;
  if (!ParseUnixSeconds(expires_text, expires_unix)) {
    return result;
  }
  auto now = std::chrono::system_clock::now();
  if (std::chrono::system_clock::from_time_t(static_cast<std::time_t>(expires_unix)) <= now) {
    result.status = CredentialStatus::kExpired;
    return result;
  }
  result.status = CredentialStatus::kOk;
  result.user_id = user_id;
  return result;
}

std::string HmacCredentialVerifier::Issue(const std::string& user_id, std::chrono::seconds ttl) const {
  return IssueUntil(user_id, std::chrono::system_clock::now() + ttl);
}

std::string HmacCredentialVerifier::IssueUntil(const std::string& user_id,
                                               std::chrono::system_clock::time_point expires_at) const {
  if (user_id.empty() || user_id.find('.') != std::string::npos) {
    throw std::invalid_argument("user_id 형식이 올바르지 않습니다");
  }
  auto body = user_id + "." + std::to_string(std::chrono::system_clock::to_time_t(expires_at));
  return body + "." + Sign(body);
}

std::string HmacCredentialVerifier::Sign(const std::string& body) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(body.data()), body.size(), digest, &digest_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

}  // namespace relay
