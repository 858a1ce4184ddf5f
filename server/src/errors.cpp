/*
 * 설명: 오류 코드를 wire 코드와 HTTP 상태로 변환한다.
 * 버전: v1.0.0
 */
#include "jts/errors.hpp"

namespace jts {

std::string ToWireCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kInvalidCredentials:
      return "invalid_credentials";
    case ErrorCode::kInvalidStateProof:
      return "invalid_state_proof";
    case ErrorCode::kSessionCompromised:
      return "session_compromised";
    case ErrorCode::kTokenExpired:
      return "token_expired";
    case ErrorCode::kTokenMalformed:
      return "token_malformed";
    case ErrorCode::kSignatureInvalid:
      return "signature_invalid";
    case ErrorCode::kDecryptionFailed:
      return "decryption_failed";
    case ErrorCode::kAudienceMismatch:
      return "audience_mismatch";
    case ErrorCode::kUnknownKey:
      return "unknown_key";
    case ErrorCode::kPermissionDenied:
      return "permission_denied";
    case ErrorCode::kStoreUnavailable:
      return "store_unavailable";
  }
  return "internal_error";
}

unsigned int ToHttpStatus(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return 200;
    case ErrorCode::kTokenMalformed:
      return 400;
    case ErrorCode::kAudienceMismatch:
    case ErrorCode::kPermissionDenied:
      return 403;
    case ErrorCode::kStoreUnavailable:
      return 503;
    default:
      return 401;
  }
}

ErrorCode FromVerificationFailure(VerificationFailure failure) {
  switch (failure) {
    case VerificationFailure::kNone:
      return ErrorCode::kNone;
    case VerificationFailure::kExpired:
      return ErrorCode::kTokenExpired;
    case VerificationFailure::kAudienceMismatch:
      return ErrorCode::kAudienceMismatch;
    case VerificationFailure::kUnknownKey:
      return ErrorCode::kUnknownKey;
    case VerificationFailure::kMalformed:
      return ErrorCode::kTokenMalformed;
    case VerificationFailure::kSignatureInvalid:
      return ErrorCode::kSignatureInvalid;
    case VerificationFailure::kDecryptionFailed:
      return ErrorCode::kDecryptionFailed;
  }
  return ErrorCode::kTokenMalformed;
}

}  // namespace jts
