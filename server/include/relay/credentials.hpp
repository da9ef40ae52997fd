/*
 * 설명: 핸드셰이크 자격 증명 검증 인터페이스와 HMAC 서명 토큰 구현.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (6, S3)
 * 테스트: server/tests/unit/credentials_test.cpp
 */
#pragma once

#include <chrono>
#include <string>

namespace relay {

enum class CredentialStatus { kOk, kUnauthorized, kExpired };

struct CredentialResult {
  CredentialStatus status{CredentialStatus::kUnauthorized};
  std::string user_id;
};

// 토큰 발급/회전은 인증 서비스가 담당하고, 이 서버는 검증만 한다.
class CredentialVerifier {
 public:
  virtual ~CredentialVerifier() = default;
  virtual CredentialResult Verify(const std::string& token) const = 0;
};

// 토큰 형식: <user_id>.<만료 유닉스초>.<HMAC-SHA256 hex>
class HmacCredentialVerifier : public CredentialVerifier {
 public:
  explicit HmacCredentialVerifier(std::string secret);

  CredentialResult Verify(const std::string& token) const override;

  std::string Issue(const std::string& user_id, std::chrono::seconds ttl) const;
  std::string IssueUntil(const std::string& user_id, std::chrono::system_clock::time_point expires_at) const;

 private:
  std::string Sign(const std::string& body) const;

  std::string secret_;
};

}  // namespace relay
