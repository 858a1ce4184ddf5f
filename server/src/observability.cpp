/*
 * 설명: 구조화 로그와 인증 이벤트 카운터를 관리한다.
 * 버전: v1.0.0
 */
#include "jts/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace jts {

LogLevel ParseLogLevel(const std::string& name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordLogin(bool success) {
  if (success) {
    logins_.fetch_add(1);
  } else {
    login_failures_.fetch_add(1);
  }
}

void Observability::RecordRotation(bool grace_path) {
  if (grace_path) {
    grace_rotations_.fetch_add(1);
  } else {
    rotations_.fetch_add(1);
  }
}

void Observability::RecordCompromise(std::uint64_t revoked_sessions) {
  compromises_.fetch_add(1);
  sessions_revoked_.fetch_add(revoked_sessions);
}

void Observability::RecordVerificationFailure() { verification_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.logins = logins_.load();
  snapshot.login_failures = login_failures_.load();
  snapshot.rotations = rotations_.load();
  snapshot.grace_rotations = grace_rotations_.load();
  snapshot.compromises = compromises_.load();
  snapshot.sessions_revoked = sessions_revoked_.load();
  snapshot.verification_failures = verification_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.principal) {
    log_json["principal"] = *ctx.principal;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.error_code) {
    log_json["errorCode"] = *ctx.error_code;
  }
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace jts
