/*
 * 설명: HTTP 연결을 처리하고 로그인/갱신/로그아웃/세션 조회 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "jts/api_response.hpp"
#include "jts/issuance_engine.hpp"
#include "jts/observability.hpp"
#include "jts/verification_engine.hpp"

namespace jts {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<IssuanceEngine> issuance,
              std::shared_ptr<VerificationEngine> verifier, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleFailure();
  std::shared_ptr<Response> NewResponse() const;
  void HandleLogin(const std::shared_ptr<Response>& res);
  void HandleMe(const std::shared_ptr<Response>& res);
  void HandleRenew(const std::shared_ptr<Response>& res);
  void HandleLogout(const std::shared_ptr<Response>& res);
  void HandleSessions(const std::shared_ptr<Response>& res);
  void HandleLogoutAll(const std::shared_ptr<Response>& res);
  void Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void ReplyAuthError(const std::shared_ptr<Response>& res, const AuthError& error);
  void SendResponse(std::shared_ptr<Response> res);
  std::optional<std::string> ParseStateProof();
  std::string RemoteIp();
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<IssuanceEngine> issuance_;
  std::shared_ptr<VerificationEngine> verifier_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> error_code_;
};

}  // namespace jts
