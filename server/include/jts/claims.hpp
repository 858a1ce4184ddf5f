/*
 * 설명: BearerPass 클레임 집합과 JSON 직렬화를 정의한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace jts {

constexpr const char* kSignedProfile = "JTS-S/v1";
constexpr const char* kConfidentialProfile = "JTS-C/v1";

struct BearerPassClaims {
  std::string principal;
  std::string audience;
  std::set<std::string> permissions;
  std::int64_t issued_at{0};
  std::int64_t expires_at{0};
  std::optional<std::string> session_id;
  std::string token_id;
  // 헤더의 kid. 발급 시에는 서명 키에서 채워지고 검증 결과에도 복원된다.
  std::string key_id;

  bool HasPermission(const std::string& permission) const { return permissions.count(permission) > 0; }
};

nlohmann::json ToJson(const BearerPassClaims& claims);

// 필수 클레임(prn, exp, iat)이 없거나 타입이 맞지 않으면 nullopt.
std::optional<BearerPassClaims> ClaimsFromJson(const nlohmann::json& payload);

}  // namespace jts
