/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "jts/errors.hpp"

namespace jts {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// PermissionDenied면 detail.missing에 누락 권한을 싣는다.
nlohmann::json MakeAuthErrorEnvelope(const AuthError& error);

// 요청에서 온 문자열(User-Agent, 경로)에 UTF-8이 아닌 바이트가 있으면 U+FFFD로 바꿔 직렬화한다.
std::string DumpEnvelope(const nlohmann::json& envelope);

}  // namespace jts
