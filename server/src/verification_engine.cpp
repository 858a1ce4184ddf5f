/*
 * 설명: 토큰 코덱과 로컬 키만으로 BearerPass를 검증한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/verification_engine_test.cpp
 */
#include "jts/verification_engine.hpp"

#include "jts/permission_gate.hpp"
#include "jts/token_codec.hpp"

namespace jts {

VerificationEngine::VerificationEngine(VerifierConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)), observability_(std::move(observability)) {}

std::optional<BearerPassClaims> VerificationEngine::Authorize(const std::string& token, AuthError& error) const {
  VerifyOptions options;
  options.now = ReadClock(config_.clock);
  options.clock_skew = config_.clock_skew;
  options.expected_audience = config_.expected_audience;
  options.require_encryption = config_.require_encryption;

  auto result = VerifyToken(token, config_.accepted_keys,
                            config_.decryption_key ? &*config_.decryption_key : nullptr, options);
  if (!result.Ok()) {
    error.code = FromVerificationFailure(result.failure);
    error.message = result.detail;
    error.missing_permissions.clear();
    if (observability_) {
      observability_->RecordVerificationFailure();
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.name = "verify.rejected";
      ctx.level = LogLevel::kDebug;
      ctx.error_code = ToWireCode(error.code);
      observability_->Log(ctx);
    }
    return std::nullopt;
  }
  return result.claims;
}

std::optional<BearerPassClaims> VerificationEngine::AuthorizeWithPermissions(const std::string& token,
                                                                             const std::vector<std::string>& required,
                                                                             AuthError& error) const {
  auto claims = Authorize(token, error);
  if (!claims) {
    return std::nullopt;
  }
  if (!RequirePermissions(*claims, required, error)) {
    return std::nullopt;
  }
  return claims;
}

}  // namespace jts
