/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.2.0
 * 테스트: server/tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace jts {

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

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // timeout은 재시도와 백오프를 포함한 호출 전체의 예산이다. 시도마다 남은 예산으로
  // 연결/읽기/쓰기(초 단위 올림)와 max_statement_time을 다시 건다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work, std::chrono::milliseconds timeout) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work, std::chrono::milliseconds timeout) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect(std::chrono::milliseconds timeout) const;
  bool IsRetryable(unsigned int code) const;
  // 남은 예산 안에 대기할 수 없으면 false.
  bool Backoff(std::size_t attempt, std::chrono::steady_clock::time_point deadline) const;

  DbConfig config_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace jts
