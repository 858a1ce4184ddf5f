/*
 * 설명: StateProof 회전 상태 기계와 재사용 탐지 시 주체 전체 세션 폐기를 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/issuance_engine_test.cpp, server/tests/unit/rotation_concurrency_test.cpp
 */
#include "jts/issuance_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "jts/encoding.hpp"
#include "jts/token_codec.hpp"

namespace jts {

namespace {
void SetError(AuthError& error, ErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  error.missing_permissions.clear();
}

std::int64_t ToEpochSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// 한 연산 안의 모든 저장소 호출은 같은 마감 시각을 나눠 쓴다.
SessionStore::Timeout Remaining(StoreDeadline deadline) {
  auto left = std::chrono::duration_cast<SessionStore::Timeout>(deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    throw StoreUnavailableError("저장소 작업 시간 예산을 모두 사용했습니다");
  }
  return left;
}
}  // namespace

IssuanceEngine::IssuanceEngine(IssuanceConfig config, std::shared_ptr<SessionStore> store,
                               std::shared_ptr<CredentialValidator> validator,
                               std::shared_ptr<Observability> observability)
    : config_(std::move(config)), store_(std::move(store)), validator_(std::move(validator)),
      observability_(std::move(observability)) {
  if (!config_.signing_key.pkey || !config_.signing_key.has_private) {
    throw std::invalid_argument("발급 엔진에는 서명 개인키가 필요합니다");
  }
  if (!store_) {
    throw std::invalid_argument("세션 저장소가 필요합니다");
  }
  if (config_.max_rotate_attempts == 0) {
    config_.max_rotate_attempts = 1;
  }
}

TimePoint IssuanceEngine::Now() const { return ReadClock(config_.clock); }

StoreDeadline IssuanceEngine::NewDeadline() const { return std::chrono::steady_clock::now() + config_.store_timeout; }

std::string IssuanceEngine::NewStateProof() const { return "sp_" + RandomBase64Url(config_.proof_bytes); }

std::string IssuanceEngine::NewSessionId() const { return "aid_" + RandomHex(16); }

IssuedCredentials IssuanceEngine::BuildCredentials(const Session& session, TimePoint now) const {
  BearerPassClaims claims;
  claims.principal = session.principal;
  claims.audience = config_.audience;
  claims.permissions = session.permissions;
  claims.issued_at = ToEpochSeconds(now);
  claims.expires_at = ToEpochSeconds(now + config_.bearer_ttl);
  claims.session_id = session.session_id;

  IssuedCredentials creds;
  creds.bearer_pass = IssueToken(claims, config_.signing_key,
                                 config_.encryption_recipient ? &*config_.encryption_recipient : nullptr);
  creds.state_proof = session.current_proof;
  creds.session_id = session.session_id;
  creds.principal = session.principal;
  creds.bearer_expires_at = TimePoint(std::chrono::seconds(claims.expires_at));
  creds.session_expires_at = session.expires_at;
  creds.version = session.version;
  return creds;
}

std::optional<IssuedCredentials> IssuanceEngine::Login(const RawCredentials& credentials, const LoginContext& context,
                                                       AuthError& error) {
  std::optional<ValidatedPrincipal> validated;
  if (validator_) {
    validated = validator_->Validate(credentials);
  }
  if (!validated) {
    if (observability_) {
      observability_->RecordLogin(false);
    }
    LogEvent("auth.login_rejected", LogLevel::kInfo, std::nullopt, std::nullopt,
             ToWireCode(ErrorCode::kInvalidCredentials));
    SetError(error, ErrorCode::kInvalidCredentials, "자격 증명이 올바르지 않습니다");
    return std::nullopt;
  }

  auto now = Now();
  Session session;
  session.session_id = NewSessionId();
  session.principal = validated->principal;
  session.current_proof = NewStateProof();
  session.version = 1;
  session.created_at = now;
  session.last_active_at = now;
  session.expires_at = now + config_.session_ttl;
  session.permissions = validated->permissions;
  session.device_fingerprint = context.device_fingerprint;
  session.user_agent = context.user_agent;
  session.ip_address = context.ip_address;
  session.metadata = context.metadata.is_object() ? context.metadata : nlohmann::json::object();

  IssuedCredentials creds;
  try {
    creds = BuildCredentials(session, now);
  } catch (const std::runtime_error& ex) {
    LogEvent("auth.login_issue_error", LogLevel::kError, session.principal, std::nullopt,
             ToWireCode(ErrorCode::kStoreUnavailable));
    SetError(error, ErrorCode::kStoreUnavailable, std::string("BearerPass 발급 실패: ") + ex.what());
    return std::nullopt;
  }
  try {
    auto deadline = NewDeadline();
    EnforceSessionCap(session.principal, now, deadline);
    store_->Create(session, Remaining(deadline));
  } catch (const StoreUnavailableError& ex) {
    LogEvent("auth.login_store_error", LogLevel::kError, session.principal, std::nullopt,
             ToWireCode(ErrorCode::kStoreUnavailable));
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  }
  if (observability_) {
    observability_->RecordLogin(true);
  }
  LogEvent("auth.login", LogLevel::kInfo, session.principal, session.session_id, std::nullopt);
  return creds;
}

std::optional<IssuedCredentials> IssuanceEngine::Rotate(const std::string& presented_proof, AuthError& error) {
  if (presented_proof.empty()) {
    SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
    return std::nullopt;
  }
  auto now = Now();
  auto deadline = NewDeadline();
  try {
    for (std::size_t attempt = 0; attempt < config_.max_rotate_attempts; ++attempt) {
      auto session = store_->GetByCurrentOrPreviousProof(presented_proof, Remaining(deadline));
      if (!session) {
        auto retired = store_->FindRetiredProof(presented_proof, Remaining(deadline));
        if (retired) {
          return RevokeForReplay(retired->principal, retired->session_id, "retired_proof", deadline, error);
        }
        SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
        return std::nullopt;
      }
      if (now > session->expires_at) {
        store_->DeleteSession(session->session_id, Remaining(deadline));
        SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
        return std::nullopt;
      }

      if (ConstantTimeEquals(presented_proof, session->current_proof)) {
        RotationUpdate update;
        update.session_id = session->session_id;
        update.expected_version = session->version;
        update.expected_current_proof = session->current_proof;
        update.new_current_proof = NewStateProof();
        update.rotated_at = now;
        auto outcome = store_->ConditionalUpdate(update, Remaining(deadline));
        if (outcome == UpdateOutcome::kNotFound) {
          SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
          return std::nullopt;
        }
        if (outcome == UpdateOutcome::kConflict) {
          // 다른 요청이 먼저 회전했다. 다시 읽으면 유예 경로로 판정될 수 있다.
          LogEvent("auth.rotate_conflict", LogLevel::kDebug, session->principal, session->session_id, std::nullopt);
          continue;
        }
        session->previous_proof = session->current_proof;
        session->current_proof = update.new_current_proof;
        session->version += 1;
        session->rotated_at = now;
        session->last_active_at = now;
        auto creds = BuildCredentials(*session, now);
        if (observability_) {
          observability_->RecordRotation(false);
        }
        LogEvent("auth.rotate", LogLevel::kInfo, session->principal, session->session_id, std::nullopt);
        return creds;
      }

      if (session->previous_proof && ConstantTimeEquals(presented_proof, *session->previous_proof)) {
        if (session->rotated_at && now - *session->rotated_at <= config_.grace_window) {
          auto creds = BuildCredentials(*session, now);
          creds.grace_path = true;
          if (observability_) {
            observability_->RecordRotation(true);
          }
          LogEvent("auth.rotate_grace", LogLevel::kInfo, session->principal, session->session_id, std::nullopt);
          return creds;
        }
        return RevokeForReplay(session->principal, session->session_id, "previous_proof_outside_grace", deadline,
                               error);
      }

      return RevokeForReplay(session->principal, session->session_id, "proof_mismatch", deadline, error);
    }
  } catch (const StoreUnavailableError& ex) {
    LogEvent("auth.rotate_store_error", LogLevel::kError, std::nullopt, std::nullopt,
             ToWireCode(ErrorCode::kStoreUnavailable));
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  } catch (const std::runtime_error& ex) {
    // 회전은 이미 반영됐을 수 있다. 클라이언트가 같은 증명으로 재시도하면 유예 경로로 새 증명을 받는다.
    LogEvent("auth.rotate_issue_error", LogLevel::kError, std::nullopt, std::nullopt,
             ToWireCode(ErrorCode::kStoreUnavailable));
    SetError(error, ErrorCode::kStoreUnavailable, std::string("BearerPass 발급 실패: ") + ex.what());
    return std::nullopt;
  }
  SetError(error, ErrorCode::kStoreUnavailable, "회전 경합이 계속되어 재시도 한도를 초과했습니다");
  return std::nullopt;
}

std::optional<IssuedCredentials> IssuanceEngine::RevokeForReplay(const std::string& principal,
                                                                 const std::string& session_id,
                                                                 const std::string& reason, StoreDeadline deadline,
                                                                 AuthError& error) {
  // 폐기가 끝난 뒤에만 오류를 돌려준다. 폐기 자체가 실패하면 StoreUnavailableError가 호출자로 전파된다.
  auto revoked = store_->DeleteAllForPrincipal(principal, Remaining(deadline));
  if (observability_) {
    observability_->RecordCompromise(revoked);
  }
  LogEvent("auth.replay_detected." + reason, LogLevel::kWarn, principal, session_id,
           ToWireCode(ErrorCode::kSessionCompromised));
  SetError(error, ErrorCode::kSessionCompromised, "세션이 탈취된 것으로 판단되어 모든 세션을 폐기했습니다");
  return std::nullopt;
}

void IssuanceEngine::EnforceSessionCap(const std::string& principal, TimePoint now, StoreDeadline deadline) {
  if (config_.max_sessions_per_principal == 0) {
    return;
  }
  // 만료된 세션은 한도에 세지 않는다. 정리는 SweepExpired가 맡는다.
  std::vector<Session> live;
  for (auto& session : store_->ListForPrincipal(principal, Remaining(deadline))) {
    if (now <= session.expires_at) {
      live.push_back(std::move(session));
    }
  }
  if (live.size() < config_.max_sessions_per_principal) {
    return;
  }
  std::sort(live.begin(), live.end(),
            [](const Session& a, const Session& b) { return a.last_active_at < b.last_active_at; });
  std::size_t excess = live.size() - config_.max_sessions_per_principal + 1;
  for (std::size_t i = 0; i < excess; ++i) {
    store_->DeleteSession(live[i].session_id, Remaining(deadline));
    LogEvent("auth.session_evicted", LogLevel::kInfo, principal, live[i].session_id, std::nullopt);
  }
}

std::optional<Session> IssuanceEngine::FindLiveSession(const std::string& presented_proof, TimePoint now,
                                                       StoreDeadline deadline, AuthError& error) {
  auto session = store_->GetByCurrentOrPreviousProof(presented_proof, Remaining(deadline));
  if (!session || now > session->expires_at) {
    SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
    return std::nullopt;
  }
  if (ConstantTimeEquals(presented_proof, session->current_proof)) {
    return session;
  }
  if (session->rotated_at && now - *session->rotated_at <= config_.grace_window) {
    return session;
  }
  SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
  return std::nullopt;
}

bool IssuanceEngine::Logout(const std::string& presented_proof, AuthError& error) {
  try {
    auto deadline = NewDeadline();
    auto session = store_->GetByCurrentOrPreviousProof(presented_proof, Remaining(deadline));
    if (!session) {
      return true;
    }
    store_->DeleteSession(session->session_id, Remaining(deadline));
    LogEvent("auth.logout", LogLevel::kInfo, session->principal, session->session_id, std::nullopt);
    return true;
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return false;
  }
}

std::optional<std::size_t> IssuanceEngine::LogoutAll(const std::string& principal, AuthError& error) {
  try {
    auto removed = store_->DeleteAllForPrincipal(principal, config_.store_timeout);
    LogEvent("auth.logout_all", LogLevel::kInfo, principal, std::nullopt, std::nullopt);
    return removed;
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  }
}

std::optional<std::vector<SessionSummary>> IssuanceEngine::ListSessions(const std::string& principal,
                                                                        AuthError& error) {
  try {
    auto now = Now();
    std::vector<SessionSummary> summaries;
    for (const auto& session : store_->ListForPrincipal(principal, config_.store_timeout)) {
      if (now <= session.expires_at) {
        summaries.push_back(Summarize(session));
      }
    }
    return summaries;
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  }
}

std::optional<SessionSummary> IssuanceEngine::Introspect(const std::string& presented_proof, AuthError& error) {
  try {
    auto session = FindLiveSession(presented_proof, Now(), NewDeadline(), error);
    if (!session) {
      return std::nullopt;
    }
    return Summarize(*session);
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  }
}

bool IssuanceEngine::Touch(const std::string& presented_proof, AuthError& error) {
  try {
    auto now = Now();
    auto deadline = NewDeadline();
    auto session = FindLiveSession(presented_proof, now, deadline, error);
    if (!session) {
      return false;
    }
    if (!store_->Touch(session->session_id, now, Remaining(deadline))) {
      SetError(error, ErrorCode::kInvalidStateProof, "StateProof가 올바르지 않습니다");
      return false;
    }
    return true;
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return false;
  }
}

std::optional<std::size_t> IssuanceEngine::SweepExpired(AuthError& error) {
  try {
    auto removed = store_->DeleteExpired(Now(), config_.store_timeout);
    if (removed > 0) {
      LogEvent("auth.sweep_expired", LogLevel::kInfo, std::nullopt, std::nullopt, std::nullopt);
    }
    return removed;
  } catch (const StoreUnavailableError& ex) {
    SetError(error, ErrorCode::kStoreUnavailable, ex.what());
    return std::nullopt;
  }
}

bool IssuanceEngine::HealthCheck() {
  try {
    return store_->HealthCheck(config_.store_timeout);
  } catch (const StoreUnavailableError&) {
    return false;
  }
}

KeyRing IssuanceEngine::PublicKeyRing() const { return KeyRing{PublicOnly(config_.signing_key)}; }

void IssuanceEngine::LogEvent(const std::string& name, LogLevel level, const std::optional<std::string>& principal,
                              const std::optional<std::string>& session_id,
                              const std::optional<std::string>& error_code) const {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = name;
  ctx.level = level;
  ctx.principal = principal;
  ctx.session_id = session_id;
  ctx.error_code = error_code;
  observability_->Log(ctx);
}

}  // namespace jts
