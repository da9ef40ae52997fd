#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "relay/db_client.hpp"
#include "relay/schema.hpp"
#include "relay/util.hpp"

namespace relay_test {

inline relay::DbConfig TestDbConfig() {
  relay::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

inline bool DbReachable(const relay::DbConfig& cfg) {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    return false;
  }
  unsigned int timeout = 2;
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  bool ok = mysql_real_connect(conn, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(), cfg.database.c_str(),
                               cfg.port, nullptr, 0) != nullptr;
  mysql_close(conn);
  return ok;
}

// 스키마를 보장하고 테스트마다 새 대화를 만든다. DB가 없으면 SetUp에서 건너뛴다.
class DbTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cfg = TestDbConfig();
    if (!DbReachable(cfg)) {
      GTEST_SKIP() << "MariaDB에 연결할 수 없습니다: " << cfg.host << ":" << cfg.port;
    }
    db_client_ = std::make_shared<relay::MariaDbClient>(cfg);
    relay::EnsureSchema(*db_client_);
  }

  std::string CreateConversation(const std::vector<std::string>& members) {
    auto conversation_id = "it-" + relay::GenerateUuid();
    Exec("INSERT INTO conversations (id, updated_at) VALUES ('" + conversation_id + "', UTC_TIMESTAMP(6))");
    for (const auto& member : members) {
      Exec("INSERT INTO conversation_members (conversation_id, user_id) VALUES ('" + conversation_id + "', '" +
           member + "')");
    }
    return conversation_id;
  }

  void Exec(const std::string& sql) {
    db_client_->WithConnectionRetry([&](MYSQL* conn) { db_client_->Execute(conn, sql, "테스트 SQL 실패"); });
  }

  std::uint64_t CountRows(const std::string& sql) {
    std::uint64_t count = 0;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      auto res = db_client_->Store(conn, sql, "테스트 조회 실패");
      MYSQL_ROW row = mysql_fetch_row(res.get());
      count = (row && row[0]) ? std::stoull(row[0]) : 0;
    });
    return count;
  }

  std::shared_ptr<relay::MariaDbClient> db_client_;
};

}  // namespace relay_test
