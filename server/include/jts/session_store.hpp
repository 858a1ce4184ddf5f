/*
 * 설명: 세션 저장소 포트. 회전은 버전 태그 기반 조건부 갱신으로만 일어난다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/in_memory_session_store_test.cpp, server/tests/it/mariadb_session_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "jts/errors.hpp"
#include "jts/session.hpp"

namespace jts {

// 모든 연산은 호출자가 준 timeout 안에 끝나야 하며, 시간 초과나 장애는
// StoreUnavailableError로 알린다. 구현체는 스레드 안전해야 한다.
class SessionStore {
 public:
  using Timeout = std::chrono::milliseconds;

  virtual ~SessionStore() = default;

  virtual void Create(const Session& session, Timeout timeout) = 0;
  virtual std::optional<Session> GetByCurrentOrPreviousProof(const std::string& proof, Timeout timeout) = 0;

  // 성공 시 previous := expected_current, current := new, version += 1,
  // rotated_at/last_active_at 갱신, 밀려난 previous는 retired 기록으로 옮긴다.
  virtual UpdateOutcome ConditionalUpdate(const RotationUpdate& update, Timeout timeout) = 0;

  virtual std::optional<RetiredProof> FindRetiredProof(const std::string& proof, Timeout timeout) = 0;
  virtual bool Touch(const std::string& session_id, TimePoint now, Timeout timeout) = 0;
  virtual bool DeleteSession(const std::string& session_id, Timeout timeout) = 0;

  // 주체의 세션과 retired 기록을 하나의 원자적 연산으로 지운다.
  virtual std::size_t DeleteAllForPrincipal(const std::string& principal, Timeout timeout) = 0;
  virtual std::vector<Session> ListForPrincipal(const std::string& principal, Timeout timeout) = 0;
  virtual std::size_t DeleteExpired(TimePoint now, Timeout timeout) = 0;
  virtual bool HealthCheck(Timeout timeout) = 0;
};

}  // namespace jts
