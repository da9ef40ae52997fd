/*
 * 설명: 대화 멤버십 확인 인터페이스와 MariaDB 구현.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (6, S3)
 * 테스트: server/tests/it/sequencer_it_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "relay/db_client.hpp"

namespace relay {

class MembershipChecker {
 public:
  virtual ~MembershipChecker() = default;
  virtual bool IsMember(const std::string& conversation_id, const std::string& user_id) const = 0;
  // 여러 대화를 한 번에 확인한다. 반환값은 user_id가 멤버인 대화 id 집합이다.
  virtual std::unordered_set<std::string> MemberOf(const std::vector<std::string>& conversation_ids,
                                                   const std::string& user_id) const;
};

class MariaDbMembershipChecker : public MembershipChecker {
 public:
  explicit MariaDbMembershipChecker(std::shared_ptr<MariaDbClient> db_client);

  bool IsMember(const std::string& conversation_id, const std::string& user_id) const override;
  std::unordered_set<std::string> MemberOf(const std::vector<std::string>& conversation_ids,
                                           const std::string& user_id) const override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace relay
