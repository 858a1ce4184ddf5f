/*
 * 설명: 세션 레코드, 조회용 요약, 회전 시 조건부 갱신 필드를 정의한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/in_memory_session_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "jts/clock.hpp"

namespace jts {

struct Session {
  std::string session_id;
  std::string principal;
  std::string current_proof;
  std::optional<std::string> previous_proof;
  std::uint64_t version{1};
  std::optional<TimePoint> rotated_at;
  TimePoint expires_at;
  TimePoint last_active_at;
  TimePoint created_at;
  std::set<std::string> permissions;
  // 감사용 메타데이터. 신뢰 판단에는 쓰지 않는다.
  std::string device_fingerprint;
  std::string user_agent;
  std::string ip_address;
  nlohmann::json metadata = nlohmann::json::object();
};

// 비밀값이 빠진 세션 정보.
struct SessionSummary {
  std::string session_id;
  std::string principal;
  std::uint64_t version{1};
  TimePoint created_at;
  TimePoint last_active_at;
  TimePoint expires_at;
  std::optional<TimePoint> rotated_at;
  std::string device_fingerprint;
  std::string user_agent;
  std::string ip_address;
  nlohmann::json metadata = nlohmann::json::object();
};

SessionSummary Summarize(const Session& session);

// (session_id, expected_version, expected_current_proof)가 일치할 때만 적용된다.
struct RotationUpdate {
  std::string session_id;
  std::uint64_t expected_version{0};
  std::string expected_current_proof;
  std::string new_current_proof;
  TimePoint rotated_at;
};

enum class UpdateOutcome { kApplied, kConflict, kNotFound };

// 회전으로 밀려난 증명값의 다이제스트 기록.
struct RetiredProof {
  std::string proof_digest;
  std::string session_id;
  std::string principal;
  TimePoint retired_at;
  TimePoint expires_at;
};

}  // namespace jts
