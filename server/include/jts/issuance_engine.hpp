/*
 * 설명: 로그인, StateProof 회전/재사용 탐지, 로그아웃과 세션 조회를 담당하는 발급 엔진.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/issuance_engine_test.cpp, server/tests/unit/rotation_concurrency_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "jts/clock.hpp"
#include "jts/credential_validator.hpp"
#include "jts/errors.hpp"
#include "jts/keys.hpp"
#include "jts/observability.hpp"
#include "jts/session_store.hpp"

namespace jts {

using StoreDeadline = std::chrono::steady_clock::time_point;

struct IssuanceConfig {
  SigningKey signing_key;
  // 있으면 JTS-C/v1로 발급한다.
  std::optional<EncryptionKey> encryption_recipient;
  std::string audience;
  std::chrono::seconds bearer_ttl{std::chrono::seconds(300)};
  std::chrono::seconds session_ttl{std::chrono::hours(24 * 7)};
  std::chrono::seconds grace_window{std::chrono::seconds(10)};
  // 연산 하나(회전 재시도 포함)가 저장소에 쓸 수 있는 전체 시간.
  std::chrono::milliseconds store_timeout{std::chrono::milliseconds(2000)};
  std::size_t max_rotate_attempts{5};
  // 0이면 제한 없음.
  std::size_t max_sessions_per_principal{0};
  std::size_t proof_bytes{32};
  Clock clock;
};

struct LoginContext {
  std::string device_fingerprint;
  std::string user_agent;
  std::string ip_address;
  nlohmann::json metadata = nlohmann::json::object();
};

struct IssuedCredentials {
  std::string bearer_pass;
  std::string state_proof;
  std::string session_id;
  std::string principal;
  TimePoint bearer_expires_at;
  TimePoint session_expires_at;
  std::uint64_t version{1};
  // 유예 구간의 이전 증명으로 갱신된 경우 true.
  bool grace_path{false};
};

class IssuanceEngine {
 public:
  // 서명 개인키가 없으면 std::invalid_argument.
  IssuanceEngine(IssuanceConfig config, std::shared_ptr<SessionStore> store,
                 std::shared_ptr<CredentialValidator> validator,
                 std::shared_ptr<Observability> observability = nullptr);

  std::optional<IssuedCredentials> Login(const RawCredentials& credentials, const LoginContext& context,
                                         AuthError& error);
  std::optional<IssuedCredentials> Rotate(const std::string& presented_proof, AuthError& error);

  // 세션이 이미 없으면 성공으로 본다. false는 저장소 장애뿐이다.
  bool Logout(const std::string& presented_proof, AuthError& error);
  std::optional<std::size_t> LogoutAll(const std::string& principal, AuthError& error);
  std::optional<std::vector<SessionSummary>> ListSessions(const std::string& principal, AuthError& error);

  std::optional<SessionSummary> Introspect(const std::string& presented_proof, AuthError& error);
  bool Touch(const std::string& presented_proof, AuthError& error);
  std::optional<std::size_t> SweepExpired(AuthError& error);
  bool HealthCheck();

  // 리소스 서버 검증기에 넘길 공개 서명 키.
  KeyRing PublicKeyRing() const;
  const IssuanceConfig& GetConfig() const { return config_; }

 private:
  TimePoint Now() const;
  StoreDeadline NewDeadline() const;
  std::string NewStateProof() const;
  std::string NewSessionId() const;
  IssuedCredentials BuildCredentials(const Session& session, TimePoint now) const;
  std::optional<Session> FindLiveSession(const std::string& presented_proof, TimePoint now, StoreDeadline deadline,
                                         AuthError& error);
  std::optional<IssuedCredentials> RevokeForReplay(const std::string& principal, const std::string& session_id,
                                                   const std::string& reason, StoreDeadline deadline,
                                                   AuthError& error);
  void EnforceSessionCap(const std::string& principal, TimePoint now, StoreDeadline deadline);
  void LogEvent(const std::string& name, LogLevel level, const std::optional<std::string>& principal,
                const std::optional<std::string>& session_id, const std::optional<std::string>& error_code) const;

  IssuanceConfig config_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<CredentialValidator> validator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace jts
