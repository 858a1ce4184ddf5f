/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "jts/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace jts {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeAuthErrorEnvelope(const AuthError& error) {
  nlohmann::json detail = nullptr;
  if (error.code == ErrorCode::kPermissionDenied) {
    detail = {{"missing", error.missing_permissions}};
  } else if (error.Retryable()) {
    detail = {{"retryable", true}};
  }
  return MakeErrorEnvelope(ToWireCode(error.code), error.message, detail);
}

std::string DumpEnvelope(const nlohmann::json& envelope) {
  return envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace jts
