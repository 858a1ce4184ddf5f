/*
 * 설명: 요구 권한과 토큰 권한 집합의 포함 관계를 판정한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/permission_gate_test.cpp
 */
#include "jts/permission_gate.hpp"

#include <unordered_set>

namespace jts {

PermissionDecision EvaluatePermissions(const BearerPassClaims& claims, const std::vector<std::string>& required) {
  PermissionDecision decision;
  std::unordered_set<std::string> reported;
  for (const auto& permission : required) {
    if (claims.HasPermission(permission)) {
      continue;
    }
    if (reported.insert(permission).second) {
      decision.missing.push_back(permission);
    }
  }
  decision.granted = decision.missing.empty();
  return decision;
}

bool RequirePermissions(const BearerPassClaims& claims, const std::vector<std::string>& required, AuthError& error) {
  auto decision = EvaluatePermissions(claims, required);
  if (decision.granted) {
    return true;
  }
  error.code = ErrorCode::kPermissionDenied;
  std::string joined;
  for (const auto& name : decision.missing) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  error.message = "권한이 부족합니다: " + joined;
  error.missing_permissions = std::move(decision.missing);
  return false;
}

}  // namespace jts
