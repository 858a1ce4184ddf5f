/*
 * 설명: MariaDB 세션 저장소 구현. 시각은 epoch 마이크로초 BIGINT로 저장한다.
 * 버전: v1.0.0
 * 테스트: server/tests/it/mariadb_session_store_it_test.cpp
 */
#include "jts/mariadb_session_store.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

#include "jts/encoding.hpp"

namespace jts {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kSessionColumns =
    "session_id, principal, current_proof, previous_proof, version, rotated_at_us, expires_at_us, "
    "last_active_at_us, created_at_us, permissions, device_fingerprint, user_agent, ip_address, metadata";

long long ToMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromMicros(const char* value) {
  long long micros = value ? std::stoll(value) : 0;
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros)));
}

std::string Text(const char* value) { return value ? value : ""; }

// 예외를 엔진 계약인 StoreUnavailableError로 바꾼다.
template <typename Fn>
auto Guarded(const std::string& op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DbException& ex) {
    throw StoreUnavailableError(op + ": " + ex.what(), ex.retryable);
  }
}
}  // namespace

MariaDbSessionStore::MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbSessionStore::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, ctx);
  }
}

void MariaDbSessionStore::EnsureSchema(Timeout timeout) {
  Guarded("ensure_schema", [&] {
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          Execute(conn,
                  "CREATE TABLE IF NOT EXISTS jts_sessions ("
                  "session_id VARCHAR(64) NOT NULL PRIMARY KEY,"
                  "principal VARCHAR(255) NOT NULL,"
                  "current_proof VARCHAR(128) NOT NULL,"
                  "previous_proof VARCHAR(128) NULL,"
                  "version BIGINT UNSIGNED NOT NULL,"
                  "rotated_at_us BIGINT NULL,"
                  "expires_at_us BIGINT NOT NULL,"
                  "last_active_at_us BIGINT NOT NULL,"
                  "created_at_us BIGINT NOT NULL,"
                  "permissions TEXT NOT NULL,"
                  "device_fingerprint VARCHAR(512) NOT NULL DEFAULT '',"
                  "user_agent VARCHAR(512) NOT NULL DEFAULT '',"
                  "ip_address VARCHAR(64) NOT NULL DEFAULT '',"
                  "metadata TEXT NOT NULL,"
                  "UNIQUE KEY uq_jts_current_proof (current_proof),"
                  "KEY idx_jts_previous_proof (previous_proof),"
                  "KEY idx_jts_principal (principal),"
                  "KEY idx_jts_expires (expires_at_us)"
                  ") ENGINE=InnoDB;",
                  "세션 테이블 생성 실패");
          Execute(conn,
                  "CREATE TABLE IF NOT EXISTS jts_retired_proofs ("
                  "proof_digest CHAR(64) NOT NULL PRIMARY KEY,"
                  "session_id VARCHAR(64) NOT NULL,"
                  "principal VARCHAR(255) NOT NULL,"
                  "retired_at_us BIGINT NOT NULL,"
                  "expires_at_us BIGINT NOT NULL,"
                  "KEY idx_jts_retired_principal (principal),"
                  "KEY idx_jts_retired_expires (expires_at_us)"
                  ") ENGINE=InnoDB;",
                  "retired 테이블 생성 실패");
        },
        timeout);
  });
}

void MariaDbSessionStore::Create(const Session& session, Timeout timeout) {
  Guarded("create", [&] {
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          nlohmann::json permissions = session.permissions;
          std::ostringstream oss;
          oss << "INSERT INTO jts_sessions(" << kSessionColumns << ") VALUES('"
              << db_client_->Escape(conn, session.session_id) << "', '" << db_client_->Escape(conn, session.principal)
              << "', '" << db_client_->Escape(conn, session.current_proof) << "', ";
          if (session.previous_proof) {
            oss << "'" << db_client_->Escape(conn, *session.previous_proof) << "', ";
          } else {
            oss << "NULL, ";
          }
          oss << session.version << ", ";
          if (session.rotated_at) {
            oss << ToMicros(*session.rotated_at) << ", ";
          } else {
            oss << "NULL, ";
          }
          oss << ToMicros(session.expires_at) << ", " << ToMicros(session.last_active_at) << ", "
              << ToMicros(session.created_at) << ", '" << db_client_->Escape(conn, permissions.dump()) << "', '"
              << db_client_->Escape(conn, session.device_fingerprint) << "', '"
              << db_client_->Escape(conn, session.user_agent) << "', '" << db_client_->Escape(conn, session.ip_address)
              << "', '" << db_client_->Escape(conn, session.metadata.dump()) << "');";
          if (mysql_query(conn, oss.str().c_str()) != 0) {
            if (mysql_errno(conn) == kDuplicateEntry) {
              throw StoreUnavailableError("중복된 세션 ID입니다", false);
            }
            db_client_->RaiseError(conn, "세션 저장 실패");
          }
        },
        timeout);
  });
}

std::vector<Session> MariaDbSessionStore::SelectSessions(MYSQL* conn, const std::string& where_clause) const {
  std::string sql = std::string("SELECT ") + kSessionColumns + " FROM jts_sessions WHERE " + where_clause + ";";
  Execute(conn, sql, "세션 조회 실패");
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    db_client_->RaiseError(conn, "세션 조회 결과 없음");
  }
  std::vector<Session> sessions;
  while (MYSQL_ROW row = mysql_fetch_row(res)) {
    sessions.push_back(BuildSession(row));
  }
  mysql_free_result(res);
  return sessions;
}

std::optional<Session> MariaDbSessionStore::GetByCurrentOrPreviousProof(const std::string& proof, Timeout timeout) {
  return Guarded("get_by_proof", [&] {
    std::optional<Session> result;
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          std::string escaped = db_client_->Escape(conn, proof);
          auto sessions =
              SelectSessions(conn, "current_proof='" + escaped + "' OR previous_proof='" + escaped + "' LIMIT 1");
          if (!sessions.empty()) {
            result = std::move(sessions.front());
          }
        },
        timeout);
    return result;
  });
}

UpdateOutcome MariaDbSessionStore::ConditionalUpdate(const RotationUpdate& update, Timeout timeout) {
  return Guarded("conditional_update", [&] {
    UpdateOutcome outcome = UpdateOutcome::kNotFound;
    db_client_->ExecuteTransactionWithRetry(
        [&](MYSQL* conn) {
          std::string escaped_id = db_client_->Escape(conn, update.session_id);
          auto locked = SelectSessions(conn, "session_id='" + escaped_id + "' FOR UPDATE");
          if (locked.empty()) {
            outcome = UpdateOutcome::kNotFound;
            return false;
          }
          const Session& current = locked.front();
          if (current.version != update.expected_version ||
              !ConstantTimeEquals(current.current_proof, update.expected_current_proof)) {
            outcome = UpdateOutcome::kConflict;
            return false;
          }
          if (current.previous_proof) {
            std::ostringstream retire;
            retire << "INSERT IGNORE INTO jts_retired_proofs(proof_digest, session_id, principal, retired_at_us, "
                      "expires_at_us) VALUES('"
                   << Sha256Hex(*current.previous_proof) << "', '" << escaped_id << "', '"
                   << db_client_->Escape(conn, current.principal) << "', " << ToMicros(update.rotated_at) << ", "
                   << ToMicros(current.expires_at) << ");";
            Execute(conn, retire.str(), "retired 기록 실패");
          }
          auto rotated_us = ToMicros(update.rotated_at);
          std::ostringstream oss;
          oss << "UPDATE jts_sessions SET previous_proof=current_proof, current_proof='"
              << db_client_->Escape(conn, update.new_current_proof) << "', version=version+1, rotated_at_us="
              << rotated_us << ", last_active_at_us=" << rotated_us << " WHERE session_id='" << escaped_id
              << "' AND version=" << update.expected_version << " AND current_proof='"
              << db_client_->Escape(conn, update.expected_current_proof) << "';";
          Execute(conn, oss.str(), "세션 회전 실패");
          if (mysql_affected_rows(conn) != 1) {
            outcome = UpdateOutcome::kConflict;
            return false;
          }
          outcome = UpdateOutcome::kApplied;
          return true;
        },
        timeout);
    return outcome;
  });
}

std::optional<RetiredProof> MariaDbSessionStore::FindRetiredProof(const std::string& proof, Timeout timeout) {
  return Guarded("find_retired", [&] {
    std::optional<RetiredProof> result;
    std::string digest = Sha256Hex(proof);
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          std::string sql =
              "SELECT proof_digest, session_id, principal, retired_at_us, expires_at_us FROM jts_retired_proofs "
              "WHERE proof_digest='" +
              digest + "';";
          Execute(conn, sql, "retired 조회 실패");
          MYSQL_RES* res = mysql_store_result(conn);
          if (!res) {
            db_client_->RaiseError(conn, "retired 조회 결과 없음");
          }
          MYSQL_ROW row = mysql_fetch_row(res);
          if (row) {
            result = RetiredProof{Text(row[0]), Text(row[1]), Text(row[2]), FromMicros(row[3]), FromMicros(row[4])};
          }
          mysql_free_result(res);
        },
        timeout);
    return result;
  });
}

bool MariaDbSessionStore::Touch(const std::string& session_id, TimePoint now, Timeout timeout) {
  return Guarded("touch", [&] {
    bool touched = false;
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          std::ostringstream oss;
          oss << "UPDATE jts_sessions SET last_active_at_us=" << ToMicros(now) << " WHERE session_id='"
              << db_client_->Escape(conn, session_id) << "';";
          Execute(conn, oss.str(), "세션 활동 갱신 실패");
          // 같은 값으로 갱신되면 affected_rows가 0이므로 존재 여부는 matched 정보로 판단한다.
          const char* info = mysql_info(conn);
          unsigned long matched = 0;
          if (info) {
            std::sscanf(info, "Rows matched: %lu", &matched);
          }
          touched = matched > 0 || mysql_affected_rows(conn) > 0;
        },
        timeout);
    return touched;
  });
}

bool MariaDbSessionStore::DeleteSession(const std::string& session_id, Timeout timeout) {
  return Guarded("delete", [&] {
    bool removed = false;
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          Execute(conn, "DELETE FROM jts_sessions WHERE session_id='" + db_client_->Escape(conn, session_id) + "';",
                  "세션 삭제 실패");
          removed = mysql_affected_rows(conn) > 0;
        },
        timeout);
    return removed;
  });
}

std::size_t MariaDbSessionStore::DeleteAllForPrincipal(const std::string& principal, Timeout timeout) {
  return Guarded("delete_all_for_principal", [&] {
    std::size_t removed = 0;
    db_client_->ExecuteTransactionWithRetry(
        [&](MYSQL* conn) {
          std::string escaped = db_client_->Escape(conn, principal);
          Execute(conn, "DELETE FROM jts_sessions WHERE principal='" + escaped + "';", "주체 세션 삭제 실패");
          removed = static_cast<std::size_t>(mysql_affected_rows(conn));
          Execute(conn, "DELETE FROM jts_retired_proofs WHERE principal='" + escaped + "';", "주체 retired 삭제 실패");
          return true;
        },
        timeout);
    return removed;
  });
}

std::vector<Session> MariaDbSessionStore::ListForPrincipal(const std::string& principal, Timeout timeout) {
  return Guarded("list_for_principal", [&] {
    std::vector<Session> sessions;
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          sessions =
              SelectSessions(conn, "principal='" + db_client_->Escape(conn, principal) + "' ORDER BY created_at_us");
        },
        timeout);
    return sessions;
  });
}

std::size_t MariaDbSessionStore::DeleteExpired(TimePoint now, Timeout timeout) {
  return Guarded("delete_expired", [&] {
    std::size_t removed = 0;
    db_client_->ExecuteTransactionWithRetry(
        [&](MYSQL* conn) {
          auto now_us = std::to_string(ToMicros(now));
          Execute(conn, "DELETE FROM jts_sessions WHERE expires_at_us < " + now_us + ";", "만료 세션 삭제 실패");
          removed = static_cast<std::size_t>(mysql_affected_rows(conn));
          Execute(conn, "DELETE FROM jts_retired_proofs WHERE expires_at_us < " + now_us + ";",
                  "만료 retired 삭제 실패");
          return true;
        },
        timeout);
    return removed;
  });
}

bool MariaDbSessionStore::HealthCheck(Timeout timeout) {
  try {
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          Execute(conn, "SELECT 1;", "헬스 체크 실패");
          MYSQL_RES* res = mysql_store_result(conn);
          if (res) {
            mysql_free_result(res);
          }
        },
        timeout);
    return true;
  } catch (const DbException&) {
    return false;
  }
}

void MariaDbSessionStore::ClearAll(Timeout timeout) {
  Guarded("clear_all", [&] {
    db_client_->WithConnectionRetry(
        [&](MYSQL* conn) {
          Execute(conn, "DELETE FROM jts_retired_proofs;", "retired 초기화 실패");
          Execute(conn, "DELETE FROM jts_sessions;", "세션 초기화 실패");
        },
        timeout);
  });
}

Session MariaDbSessionStore::BuildSession(MYSQL_ROW row) const {
  Session session;
  session.session_id = Text(row[0]);
  session.principal = Text(row[1]);
  session.current_proof = Text(row[2]);
  if (row[3]) {
    session.previous_proof = std::string(row[3]);
  }
  session.version = row[4] ? std::stoull(row[4]) : 1;
  if (row[5]) {
    session.rotated_at = FromMicros(row[5]);
  }
  session.expires_at = FromMicros(row[6]);
  session.last_active_at = FromMicros(row[7]);
  session.created_at = FromMicros(row[8]);
  auto permissions = nlohmann::json::parse(Text(row[9]), nullptr, false);
  if (permissions.is_array()) {
    for (const auto& entry : permissions) {
      if (entry.is_string()) {
        session.permissions.insert(entry.get<std::string>());
      }
    }
  }
  session.device_fingerprint = Text(row[10]);
  session.user_agent = Text(row[11]);
  session.ip_address = Text(row[12]);
  auto metadata = nlohmann::json::parse(Text(row[13]), nullptr, false);
  session.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
  return session;
}

}  // namespace jts
