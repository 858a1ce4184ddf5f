/*
 * 설명: HTTP 요청을 엔진 연산으로 분기하고 결과를 JSON 엔벨로프로 변환한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#include "jts/http_session.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace jts {

namespace {
std::string ToIsoString(TimePoint tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json CredentialsToJson(const IssuedCredentials& creds) {
  return nlohmann::json{{"bearerPass", creds.bearer_pass},
                        {"stateProof", creds.state_proof},
                        {"expiresAt", ToIsoString(creds.bearer_expires_at)},
                        {"sessionExpiresAt", ToIsoString(creds.session_expires_at)},
                        {"sessionId", creds.session_id},
                        {"principal", creds.principal},
                        {"version", creds.version}};
}

nlohmann::json SummaryToJson(const SessionSummary& summary, bool is_current) {
  nlohmann::json j{{"sessionId", summary.session_id},
                   {"version", summary.version},
                   {"createdAt", ToIsoString(summary.created_at)},
                   {"lastActiveAt", ToIsoString(summary.last_active_at)},
                   {"expiresAt", ToIsoString(summary.expires_at)},
                   {"rotatedAt", nullptr},
                   {"deviceFingerprint", summary.device_fingerprint},
                   {"userAgent", summary.user_agent},
                   {"ipAddress", summary.ip_address},
                   {"isCurrent", is_current}};
  if (summary.rotated_at) {
    j["rotatedAt"] = ToIsoString(*summary.rotated_at);
  }
  return j;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<IssuanceEngine> issuance,
                         std::shared_ptr<VerificationEngine> verifier, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), issuance_(std::move(issuance)), verifier_(std::move(verifier)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  try {
    HandleRequest();
  } catch (const std::exception&) {
    HandleFailure();
  }
}

void HttpSession::HandleFailure() {
  try {
    error_code_ = "internal_error";
    Reply(NewResponse(), boost::beast::http::status::internal_server_error,
          MakeErrorEnvelope("internal_error", "요청을 처리하지 못했습니다"));
  } catch (const std::exception&) {
    boost::beast::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

std::shared_ptr<HttpSession::Response> HttpSession::NewResponse() const {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "jts-auth-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->set(http::field::cache_control, "no-store");
  return res;
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  error_code_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = NewResponse();

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/health") {
    bool healthy = issuance_->HealthCheck();
    nlohmann::json data{{"status", healthy ? "ok" : "degraded"},
                        {"database", healthy ? "connected" : "disconnected"},
                        {"version", "v1.0.0"}};
    return Reply(res, healthy ? http::status::ok : http::status::service_unavailable, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"logins", {{"success", snapshot.logins}, {"failure", snapshot.login_failures}}},
                        {"rotations", {{"total", snapshot.rotations}, {"grace", snapshot.grace_rotations}}},
                        {"compromises", {{"total", snapshot.compromises}, {"revoked", snapshot.sessions_revoked}}},
                        {"verification", {{"failures", snapshot.verification_failures}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post && path == "/auth/login") {
    return HandleLogin(res);
  }
  if (req_.method() == http::verb::get && path == "/auth/me") {
    return HandleMe(res);
  }
  if (req_.method() == http::verb::post && path == "/auth/renew") {
    return HandleRenew(res);
  }
  if (req_.method() == http::verb::post && path == "/auth/logout") {
    return HandleLogout(res);
  }
  if (req_.method() == http::verb::post && path == "/auth/sessions") {
    return HandleSessions(res);
  }
  if (req_.method() == http::verb::post && path == "/auth/logout-all") {
    return HandleLogoutAll(res);
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleLogin(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  nlohmann::json body_json = nlohmann::json::parse(req_.body(), nullptr, false);
  if (!body_json.is_object() || !body_json.contains("email") || !body_json.contains("password") ||
      !body_json["email"].is_string() || !body_json["password"].is_string()) {
    error_code_ = "bad_request";
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "email과 password가 필요합니다"));
  }
  RawCredentials credentials{body_json["email"].get<std::string>(), body_json["password"].get<std::string>(),
                             RemoteIp()};
  LoginContext context;
  context.ip_address = RemoteIp();
  auto agent_it = req_.find(http::field::user_agent);
  if (agent_it != req_.end()) {
    context.user_agent = std::string(agent_it->value());
  }
  if (body_json.contains("deviceFingerprint") && body_json["deviceFingerprint"].is_string()) {
    context.device_fingerprint = body_json["deviceFingerprint"].get<std::string>();
  }

  AuthError error;
  auto creds = issuance_->Login(credentials, context, error);
  if (!creds) {
    return ReplyAuthError(res, error);
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(CredentialsToJson(*creds)));
}

void HttpSession::HandleMe(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto auth_it = req_.find(http::field::authorization);
  std::string token = auth_it == req_.end() ? std::string() : ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    error_code_ = "unauthorized";
    return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "BearerPass가 필요합니다"));
  }
  AuthError error;
  auto claims = verifier_->Authorize(token, error);
  if (!claims) {
    return ReplyAuthError(res, error);
  }
  nlohmann::json data{{"principal", claims->principal},
                      {"audience", claims->audience},
                      {"permissions", claims->permissions},
                      {"issuedAt", claims->issued_at},
                      {"expiresAt", claims->expires_at},
                      {"sessionId", nullptr},
                      {"tokenId", claims->token_id},
                      {"keyId", claims->key_id}};
  if (claims->session_id) {
    data["sessionId"] = *claims->session_id;
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleRenew(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto proof = ParseStateProof();
  if (!proof) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "stateProof가 필요합니다"));
  }
  AuthError error;
  auto creds = issuance_->Rotate(*proof, error);
  if (!creds) {
    return ReplyAuthError(res, error);
  }
  auto data = CredentialsToJson(*creds);
  data["gracePath"] = creds->grace_path;
  Reply(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleLogout(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto proof = ParseStateProof();
  if (!proof) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "stateProof가 필요합니다"));
  }
  AuthError error;
  if (!issuance_->Logout(*proof, error)) {
    return ReplyAuthError(res, error);
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"loggedOut", true}}));
}

void HttpSession::HandleSessions(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto proof = ParseStateProof();
  if (!proof) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "stateProof가 필요합니다"));
  }
  AuthError error;
  auto current = issuance_->Introspect(*proof, error);
  if (!current) {
    return ReplyAuthError(res, error);
  }
  auto sessions = issuance_->ListSessions(current->principal, error);
  if (!sessions) {
    return ReplyAuthError(res, error);
  }
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& summary : *sessions) {
    entries.push_back(SummaryToJson(summary, summary.session_id == current->session_id));
  }
  Reply(res, http::status::ok,
        MakeSuccessEnvelope(nlohmann::json{{"principal", current->principal}, {"sessions", entries}}));
}

void HttpSession::HandleLogoutAll(const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto proof = ParseStateProof();
  if (!proof) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "stateProof가 필요합니다"));
  }
  AuthError error;
  auto current = issuance_->Introspect(*proof, error);
  if (!current) {
    return ReplyAuthError(res, error);
  }
  auto deleted = issuance_->LogoutAll(current->principal, error);
  if (!deleted) {
    return ReplyAuthError(res, error);
  }
  Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"deletedCount", *deleted}}));
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                        const nlohmann::json& body) {
  auto text = DumpEnvelope(body);
  res->result(status);
  res->body() = text;
  res->content_length(text.size());
  SendResponse(res);
}

void HttpSession::ReplyAuthError(const std::shared_ptr<Response>& res, const AuthError& error) {
  error_code_ = ToWireCode(error.code);
  if (error.Retryable()) {
    res->set(boost::beast::http::field::retry_after, "1");
  }
  Reply(res, static_cast<boost::beast::http::status>(ToHttpStatus(error.code)), MakeAuthErrorEnvelope(error));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.method_string()) + " " + std::string(req_.target());
    ctx.level = static_cast<unsigned>(res->result_int()) >= 500 ? LogLevel::kWarn : LogLevel::kInfo;
    ctx.error_code = error_code_;
    ctx.latency_ms = static_cast<long>(latency);
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

std::optional<std::string> HttpSession::ParseStateProof() {
  nlohmann::json body_json = nlohmann::json::parse(req_.body(), nullptr, false);
  if (!body_json.is_object() || !body_json.contains("stateProof") || !body_json["stateProof"].is_string() ||
      body_json["stateProof"].get<std::string>().empty()) {
    error_code_ = "bad_request";
    return std::nullopt;
  }
  return body_json["stateProof"].get<std::string>();
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace jts
