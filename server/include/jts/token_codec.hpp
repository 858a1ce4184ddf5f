/*
 * 설명: BearerPass 토큰의 서명(JWS)과 봉투 암호화(JWE) 발급/검증을 담당한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "jts/claims.hpp"
#include "jts/keys.hpp"

namespace jts {

enum class VerificationFailure {
  kNone,
  kExpired,
  kAudienceMismatch,
  kUnknownKey,
  kMalformed,
  kSignatureInvalid,
  kDecryptionFailed,
};

std::string ToString(VerificationFailure failure);

struct VerifyOptions {
  std::chrono::system_clock::time_point now;
  // exp에만 적용된다. iat 검사는 유예 없이 수행한다.
  std::chrono::seconds clock_skew{0};
  std::optional<std::string> expected_audience;
  bool require_encryption{false};
};

struct VerificationResult {
  std::optional<BearerPassClaims> claims;
  VerificationFailure failure{VerificationFailure::kNone};
  std::string detail;

  bool Ok() const { return claims.has_value(); }
};

class TokenCodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// recipient가 있으면 JTS-C/v1(JWE 안의 JWS), 없으면 JTS-S/v1(JWS)을 만든다.
// prn 또는 exp가 비어 있거나 서명 개인키가 없으면 TokenCodecError.
std::string IssueToken(const BearerPassClaims& claims, const SigningKey& signing_key,
                       const EncryptionKey* recipient = nullptr);

VerificationResult VerifyToken(const std::string& token, const KeyRing& accepted_keys,
                               const EncryptionKey* decryption_key, const VerifyOptions& options);

}  // namespace jts
