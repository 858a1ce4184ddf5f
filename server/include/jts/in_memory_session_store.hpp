/*
 * 설명: 슬롯 배열과 해시 인덱스로 세션을 보관하는 프로세스 내 저장소.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/in_memory_session_store_test.cpp, server/tests/unit/rotation_concurrency_test.cpp
 */
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "jts/session_store.hpp"

namespace jts {

class InMemorySessionStore : public SessionStore {
 public:
  InMemorySessionStore() = default;

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

  std::size_t Count() const;

  // 연산 이름을 받아 true를 돌려주면 해당 호출은 StoreUnavailableError로 실패한다.
  void SetFailureInjector(const std::function<bool(const std::string&)>& injector);

 private:
  std::unique_lock<std::timed_mutex> Acquire(const std::string& op, Timeout timeout);
  void EraseSlot(std::size_t slot);

  std::vector<std::optional<Session>> slots_;
  std::vector<std::size_t> free_slots_;
  std::unordered_map<std::string, std::size_t> by_id_;
  std::unordered_map<std::string, std::size_t> by_proof_;
  std::unordered_map<std::string, std::unordered_set<std::size_t>> by_principal_;
  std::unordered_map<std::string, RetiredProof> retired_;
  std::function<bool(const std::string&)> failure_injector_;
  mutable std::timed_mutex mutex_;
};

}  // namespace jts
