/*
 * 설명: 엔진이 호출 계층에 돌려주는 오류 분류와 저장소 예외를 정의한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/issuance_engine_test.cpp, server/tests/unit/permission_gate_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "jts/token_codec.hpp"

namespace jts {

enum class ErrorCode {
  kNone,
  kInvalidCredentials,
  kInvalidStateProof,
  kSessionCompromised,
  kTokenExpired,
  kTokenMalformed,
  kSignatureInvalid,
  kDecryptionFailed,
  kAudienceMismatch,
  kUnknownKey,
  kPermissionDenied,
  kStoreUnavailable,
};

struct AuthError {
  ErrorCode code{ErrorCode::kNone};
  std::string message;
  // PermissionDenied일 때만 채워진다.
  std::vector<std::string> missing_permissions;

  bool Retryable() const { return code == ErrorCode::kStoreUnavailable; }
};

// 전송 계층에 노출되는 안정적인 error_code 문자열.
std::string ToWireCode(ErrorCode code);
unsigned int ToHttpStatus(ErrorCode code);
ErrorCode FromVerificationFailure(VerificationFailure failure);

// 저장소 어댑터가 던지는 인프라 오류. 엔진 경계에서 StoreUnavailable로 바뀐다.
class StoreUnavailableError : public std::runtime_error {
 public:
  StoreUnavailableError(const std::string& message, bool retryable = true)
      : std::runtime_error(message), retryable(retryable) {}
  bool retryable;
};

}  // namespace jts
