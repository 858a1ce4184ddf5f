/*
 * 설명: MariaDB 기반 세션 저장소. 회전은 버전/증명값 조건부 UPDATE로 처리한다.
 * 버전: v1.0.0
 * 테스트: server/tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "jts/db_client.hpp"
#include "jts/session_store.hpp"

namespace jts {

class MariaDbSessionStore : public SessionStore {
 public:
  explicit MariaDbSessionStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema(Timeout timeout);

  void Create(const Session& session, Timeout timeout) override;
  std::optional<Session> GetByCurrentOrPreviousProof(const std::string& proof, Timeout timeout) override;
  UpdateOutcome ConditionalUpdate(const RotationUpdate& update, Timeout timeout) override;
  std::optional<RetiredProof> FindRetiredProof(const std::string& proof, Timeout timeout) override;
  bool Touch(const std::string& session_id, TimePoint now, Timeout timeout) override;
  bool DeleteSession(const std::string& session_id, Timeout timeout) override;
  std::size_t DeleteAllForPrincipal(const std::string& principal, Timeout timeout) override;
  std::vector<Session> ListForPrincipal(const std::string& principal, Timeout timeout) override;
  std::size_t DeleteExpired(TimePoint now, Timeout timeout) override;
  bool HealthCheck(Timeout timeout) override;

  // 테스트 전용. 두 테이블을 비운다.
  void ClearAll(Timeout timeout);

 private:
  std::vector<Session> SelectSessions(MYSQL* conn, const std::string& where_clause) const;
  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  Session BuildSession(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace jts
