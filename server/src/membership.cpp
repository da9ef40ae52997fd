/*
 * 설명: conversation_members 테이블로 멤버십을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S3)
 */
#include "relay/membership.hpp"

#include <sstream>

namespace relay {

std::unordered_set<std::string> MembershipChecker::MemberOf(const std::vector<std::string>& conversation_ids,
                                                            const std::string& user_id) const {
  std::unordered_set<std::string> members;
  for (const auto& id : conversation_ids) {
    if (IsMember(id, user_id)) {
      members.insert(id);
    }
  }
  return members;
}

MariaDbMembershipChecker::MariaDbMembershipChecker(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

bool MariaDbMembershipChecker::IsMember(const std::string& conversation_id, const std::string& user_id) const {
  return MemberOf({conversation_id}, user_id).count(conversation_id) > 0;
}

std::unordered_set<std::string> MariaDbMembershipChecker::MemberOf(const std::vector<std::string>& conversation_ids,
                                                                   const std::string& user_id) const {
  std::unordered_set<std::string> members;
  if (conversation_ids.empty()) {
    return members;
  }
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT conversation_id FROM conversation_members WHERE user_id=" << db_client_->Quote(conn, user_id)
        << " AND conversation_id IN (";
    for (std::size_t i = 0; i < conversation_ids.size(); ++i) {
      if (i > 0) {
        oss << ", ";
      }
      oss << db_client_->Quote(conn, conversation_ids[i]);
    }
    oss << ");";
    auto result = db_client_->Store(conn, oss.str(), "멤버십 조회 실패");
    members.clear();
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(result.get())) != nullptr) {
      if (row[0]) {
        members.insert(row[0]);
      }
    }
  });
  return members;
}

}  // namespace relay
