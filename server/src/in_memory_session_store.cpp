/*
 * 설명: 프로세스 내 세션 저장소. 하나의 timed_mutex로 모든 연산을 직렬화한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/in_memory_session_store_test.cpp, server/tests/unit/rotation_concurrency_test.cpp
 */
#include "jts/in_memory_session_store.hpp"

#include <algorithm>

#include "jts/encoding.hpp"

namespace jts {

std::unique_lock<std::timed_mutex> InMemorySessionStore::Acquire(const std::string& op, Timeout timeout) {
  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    throw StoreUnavailableError("세션 저장소 잠금 대기 시간 초과: " + op);
  }
  if (failure_injector_ && failure_injector_(op)) {
    throw StoreUnavailableError("주입된 저장소 장애: " + op);
  }
  return lock;
}

void InMemorySessionStore::Create(const Session& session, Timeout timeout) {
  auto lock = Acquire("create", timeout);
  if (by_id_.count(session.session_id) > 0) {
    throw StoreUnavailableError("중복된 세션 ID입니다", false);
  }
  std::size_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
    slots_[slot] = session;
  } else {
    slot = slots_.size();
    slots_.push_back(session);
  }
  by_id_[session.session_id] = slot;
  by_proof_[session.current_proof] = slot;
  if (session.previous_proof) {
    by_proof_[*session.previous_proof] = slot;
  }
  by_principal_[session.principal].insert(slot);
}

std::optional<Session> InMemorySessionStore::GetByCurrentOrPreviousProof(const std::string& proof, Timeout timeout) {
  auto lock = Acquire("get_by_proof", timeout);
  auto it = by_proof_.find(proof);
  if (it == by_proof_.end()) {
    return std::nullopt;
  }
  return slots_[it->second];
}

UpdateOutcome InMemorySessionStore::ConditionalUpdate(const RotationUpdate& update, Timeout timeout) {
  auto lock = Acquire("conditional_update", timeout);
  auto it = by_id_.find(update.session_id);
  if (it == by_id_.end()) {
    return UpdateOutcome::kNotFound;
  }
  std::size_t slot = it->second;
  Session& session = *slots_[slot];
  if (session.version != update.expected_version ||
      !ConstantTimeEquals(session.current_proof, update.expected_current_proof)) {
    return UpdateOutcome::kConflict;
  }
  if (session.previous_proof) {
    by_proof_.erase(*session.previous_proof);
    RetiredProof retired{Sha256Hex(*session.previous_proof), session.session_id, session.principal,
                         update.rotated_at, session.expires_at};
    retired_[retired.proof_digest] = retired;
  }
  session.previous_proof = session.current_proof;
  session.current_proof = update.new_current_proof;
  session.version += 1;
  session.rotated_at = update.rotated_at;
  session.last_active_at = update.rotated_at;
  by_proof_[session.current_proof] = slot;
  return UpdateOutcome::kApplied;
}

std::optional<RetiredProof> InMemorySessionStore::FindRetiredProof(const std::string& proof, Timeout timeout) {
  auto digest = Sha256Hex(proof);
  auto lock = Acquire("find_retired", timeout);
  auto it = retired_.find(digest);
  if (it == retired_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemorySessionStore::Touch(const std::string& session_id, TimePoint now, Timeout timeout) {
  auto lock = Acquire("touch", timeout);
  auto it = by_id_.find(session_id);
  if (it == by_id_.end()) {
    return false;
  }
  slots_[it->second]->last_active_at = now;
  return true;
}

void InMemorySessionStore::EraseSlot(std::size_t slot) {
  const Session& session = *slots_[slot];
  by_id_.erase(session.session_id);
  by_proof_.erase(session.current_proof);
  if (session.previous_proof) {
    by_proof_.erase(*session.previous_proof);
  }
  auto principal_it = by_principal_.find(session.principal);
  if (principal_it != by_principal_.end()) {
    principal_it->second.erase(slot);
    if (principal_it->second.empty()) {
      by_principal_.erase(principal_it);
    }
  }
  slots_[slot].reset();
  free_slots_.push_back(slot);
}

bool InMemorySessionStore::DeleteSession(const std::string& session_id, Timeout timeout) {
  auto lock = Acquire("delete", timeout);
  auto it = by_id_.find(session_id);
  if (it == by_id_.end()) {
    return false;
  }
  EraseSlot(it->second);
  return true;
}

std::size_t InMemorySessionStore::DeleteAllForPrincipal(const std::string& principal, Timeout timeout) {
  auto lock = Acquire("delete_all_for_principal", timeout);
  std::size_t removed = 0;
  auto it = by_principal_.find(principal);
  if (it != by_principal_.end()) {
    std::vector<std::size_t> owned(it->second.begin(), it->second.end());
    for (auto slot : owned) {
      EraseSlot(slot);
      ++removed;
    }
  }
  for (auto retired_it = retired_.begin(); retired_it != retired_.end();) {
    if (retired_it->second.principal == principal) {
      retired_it = retired_.erase(retired_it);
    } else {
      ++retired_it;
    }
  }
  return removed;
}

std::vector<Session> InMemorySessionStore::ListForPrincipal(const std::string& principal, Timeout timeout) {
  auto lock = Acquire("list_for_principal", timeout);
  std::vector<Session> sessions;
  auto it = by_principal_.find(principal);
  if (it == by_principal_.end()) {
    return sessions;
  }
  for (auto slot : it->second) {
    sessions.push_back(*slots_[slot]);
  }
  std::sort(sessions.begin(), sessions.end(),
            [](const Session& a, const Session& b) { return a.created_at < b.created_at; });
  return sessions;
}

std::size_t InMemorySessionStore::DeleteExpired(TimePoint now, Timeout timeout) {
  auto lock = Acquire("delete_expired", timeout);
  std::size_t removed = 0;
  for (std::size_t slot = 0; slot < slots_.size(); ++slot) {
    if (slots_[slot] && now > slots_[slot]->expires_at) {
      EraseSlot(slot);
      ++removed;
    }
  }
  for (auto it = retired_.begin(); it != retired_.end();) {
    if (now > it->second.expires_at) {
      it = retired_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

bool InMemorySessionStore::HealthCheck(Timeout timeout) {
  try {
    auto lock = Acquire("health_check", timeout);
    return true;
  } catch (const StoreUnavailableError&) {
    return false;
  }
}

std::size_t InMemorySessionStore::Count() const {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  return by_id_.size();
}

void InMemorySessionStore::SetFailureInjector(const std::function<bool(const std::string&)>& injector) {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  failure_injector_ = injector;
}

}  // namespace jts
