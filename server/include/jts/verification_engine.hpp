/*
 * 설명: 리소스 서버 측 BearerPass 검증기. 세션 저장소에 접근하지 않는다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/verification_engine_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jts/claims.hpp"
#include "jts/clock.hpp"
#include "jts/errors.hpp"
#include "jts/keys.hpp"
#include "jts/observability.hpp"

namespace jts {

struct VerifierConfig {
  KeyRing accepted_keys;
  std::optional<EncryptionKey> decryption_key;
  std::optional<std::string> expected_audience;
  std::chrono::seconds clock_skew{std::chrono::seconds(30)};
  bool require_encryption{false};
  Clock clock;
};

// 불변 설정만 읽으므로 여러 스레드에서 동시에 호출해도 된다.
class VerificationEngine {
 public:
  explicit VerificationEngine(VerifierConfig config, std::shared_ptr<Observability> observability = nullptr);

  std::optional<BearerPassClaims> Authorize(const std::string& token, AuthError& error) const;
  std::optional<BearerPassClaims> AuthorizeWithPermissions(const std::string& token,
                                                           const std::vector<std::string>& required,
                                                           AuthError& error) const;

  const VerifierConfig& GetConfig() const { return config_; }

 private:
  VerifierConfig config_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace jts
