/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace jts {

struct AppConfig {
  unsigned short port;
  // memory 또는 mariadb
  std::string session_store;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string profile;
  std::string audience;
  std::string signing_alg;
  std::string signing_kid;
  std::string signing_key_pem;
  std::string encryption_kid;
  std::string encryption_key_pem;
  std::size_t bearer_ttl_seconds;
  std::size_t session_ttl_seconds;
  std::size_t grace_window_seconds;
  std::size_t clock_skew_seconds;
  std::size_t store_timeout_ms;
  std::size_t max_sessions_per_principal;
  std::size_t login_rate_window_seconds;
  std::size_t login_rate_limit_max;
  std::size_t sweep_interval_seconds;
  std::string demo_user_email;
  std::string demo_user_password;
};

AppConfig LoadConfigFromEnv();

}  // namespace jts
