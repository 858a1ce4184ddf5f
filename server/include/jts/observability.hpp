/*
 * 설명: 구조화 로그와 인증 이벤트 카운터를 관리한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace jts {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& name);
std::string ToString(LogLevel level);

// 토큰, 증명값 같은 비밀은 절대 넣지 않는다.
struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> principal;
  std::optional<std::string> session_id;
  std::optional<std::string> error_code;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t logins{0};
  std::uint64_t login_failures{0};
  std::uint64_t rotations{0};
  std::uint64_t grace_rotations{0};
  std::uint64_t compromises{0};
  std::uint64_t sessions_revoked{0};
  std::uint64_t verification_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordLogin(bool success);
  void RecordRotation(bool grace_path);
  void RecordCompromise(std::uint64_t revoked_sessions);
  void RecordVerificationFailure();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> logins_{0};
  std::atomic<std::uint64_t> login_failures_{0};
  std::atomic<std::uint64_t> rotations_{0};
  std::atomic<std::uint64_t> grace_rotations_{0};
  std::atomic<std::uint64_t> compromises_{0};
  std::atomic<std::uint64_t> sessions_revoked_{0};
  std::atomic<std::uint64_t> verification_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace jts
