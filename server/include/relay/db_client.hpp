/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: SPEC_FULL.md (A4)
 * 테스트: server/tests/it/sequencer_it_test.cpp, server/tests/it/dispatcher_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace relay {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using StoredResult = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  StoredResult Store(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;
  std::string Quote(MYSQL* conn, const std::string& value) const { return "'" + Escape(conn, value) + "'"; }

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 5;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace relay
