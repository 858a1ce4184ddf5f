/*
 * 설명: BearerPass 클레임을 JSON 페이로드로 변환한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "jts/claims.hpp"

namespace jts {

nlohmann::json ToJson(const BearerPassClaims& claims) {
  nlohmann::json payload;
  payload["prn"] = claims.principal;
  if (!claims.audience.empty()) {
    payload["aud"] = claims.audience;
  }
  payload["perm"] = nlohmann::json::array();
  for (const auto& permission : claims.permissions) {
    payload["perm"].push_back(permission);
  }
  payload["iat"] = claims.issued_at;
  payload["exp"] = claims.expires_at;
  if (claims.session_id) {
    payload["aid"] = *claims.session_id;
  }
  if (!claims.token_id.empty()) {
    payload["tkn_id"] = claims.token_id;
  }
  return payload;
}

std::optional<BearerPassClaims> ClaimsFromJson(const nlohmann::json& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  if (!payload.contains("prn") || !payload["prn"].is_string() || !payload.contains("exp") ||
      !payload["exp"].is_number_integer() || !payload.contains("iat") || !payload["iat"].is_number_integer()) {
    return std::nullopt;
  }
  BearerPassClaims claims;
  claims.principal = payload["prn"].get<std::string>();
  claims.expires_at = payload["exp"].get<std::int64_t>();
  claims.issued_at = payload["iat"].get<std::int64_t>();
  if (payload.contains("aud")) {
    if (!payload["aud"].is_string()) {
      return std::nullopt;
    }
    claims.audience = payload["aud"].get<std::string>();
  }
  if (payload.contains("perm")) {
    if (!payload["perm"].is_array()) {
      return std::nullopt;
    }
    for (const auto& item : payload["perm"]) {
      if (!item.is_string()) {
        return std::nullopt;
      }
      claims.permissions.insert(item.get<std::string>());
    }
  }
  if (payload.contains("aid")) {
    if (!payload["aid"].is_string()) {
      return std::nullopt;
    }
    claims.session_id = payload["aid"].get<std::string>();
  }
  if (payload.contains("tkn_id") && payload["tkn_id"].is_string()) {
    claims.token_id = payload["tkn_id"].get<std::string>();
  }
  return claims;
}

}  // namespace jts
