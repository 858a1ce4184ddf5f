/*
 * 설명: MariaDB 연결과 재시도 로직을 구현한다.
 * 버전: v1.2.0
 * 테스트: server/tests/it/mariadb_session_store_it_test.cpp
 */
#include "jts/db_client.hpp"

#include <algorithm>
#include <thread>

#include <mariadb/errmsg.h>

namespace jts {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kStatementTimeout = 1969;

// Connector/C의 연결/읽기/쓰기 타임아웃은 초 단위만 받는다.
unsigned int ToTimeoutSeconds(std::chrono::milliseconds timeout) {
  auto seconds = (timeout.count() + 999) / 1000;
  return static_cast<unsigned int>(std::max<long long>(1, seconds));
}

std::string ToDecimalSeconds(std::chrono::milliseconds timeout) {
  long long ms = std::max<long long>(1, timeout.count());
  std::string fraction = std::to_string(ms % 1000);
  return std::to_string(ms / 1000) + "." + std::string(3 - fraction.size(), '0') + fraction;
}

std::chrono::milliseconds RemainingUntil(std::chrono::steady_clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
}

void EnsureBudget(std::chrono::steady_clock::time_point deadline) {
  if (RemainingUntil(deadline).count() <= 0) {
    throw DbException("저장소 호출 시간 예산 초과", 0, true);
  }
}
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect(std::chrono::milliseconds timeout) const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  unsigned int timeout_seconds = ToTimeoutSeconds(timeout);
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout_seconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout_seconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout_seconds);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn, "연결 실패");
  }
  // max_statement_time은 소수 초를 받는다.
  std::string session_limits = "SET SESSION innodb_lock_wait_timeout=" + std::to_string(timeout_seconds) +
                               ", max_statement_time=" + ToDecimalSeconds(timeout) + ";";
  if (mysql_query(conn, session_limits.c_str()) != 0) {
    RaiseError(conn, "세션 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work,
                                                std::chrono::milliseconds timeout) const {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      EnsureBudget(deadline);
      conn = Connect(RemainingUntil(deadline));
      mysql_autocommit(conn, 0);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn);
      if (commit) {
        if (mysql_commit(conn) != 0) {
          RaiseError(conn, "커밋 실패");
        }
      } else {
        mysql_rollback(conn);
      }
      mysql_close(conn);
      return commit;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_rollback(conn);
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts && Backoff(attempt, deadline)) {
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_rollback(conn);
        mysql_close(conn);
      }
      throw;
    }
  }
  return false;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work,
                                        std::chrono::milliseconds timeout) const {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      EnsureBudget(deadline);
      conn = Connect(RemainingUntil(deadline));
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(conn);
      mysql_close(conn);
      return;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_close(conn);
      }
      if (ex.retryable && attempt < kMaxAttempts && Backoff(attempt, deadline)) {
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_close(conn);
      }
      throw;
    }
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == kStatementTimeout || code == CR_SERVER_LOST ||
         code == CR_SERVER_GONE_ERROR || code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

bool MariaDbClient::Backoff(std::size_t attempt, std::chrono::steady_clock::time_point deadline) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  auto delay = std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen)));
  if (delay >= RemainingUntil(deadline)) {
    return false;
  }
  std::this_thread::sleep_for(delay);
  return true;
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace jts
