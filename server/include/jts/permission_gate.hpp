/*
 * 설명: 검증된 클레임의 권한 집합이 요구 권한을 모두 포함하는지 확인한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/permission_gate_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include "jts/claims.hpp"
#include "jts/errors.hpp"

namespace jts {

struct PermissionDecision {
  bool granted{false};
  // required 순서를 유지하며 중복은 한 번만 나온다.
  std::vector<std::string> missing;
};

PermissionDecision EvaluatePermissions(const BearerPassClaims& claims, const std::vector<std::string>& required);

// 부족하면 PermissionDenied를 채우고 false.
bool RequirePermissions(const BearerPassClaims& claims, const std::vector<std::string>& required, AuthError& error);

}  // namespace jts
