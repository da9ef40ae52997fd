/*
 * 설명: 서버가 소유하는 테이블과 참조 테이블을 준비한다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (S1)
 */
#pragma once

#include "relay/db_client.hpp"

namespace relay {

void EnsureSchema(const MariaDbClient& db_client);

}  // namespace relay
