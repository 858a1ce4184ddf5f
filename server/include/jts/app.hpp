/*
 * 설명: 서버 전체 수명주기와 엔진/저장소 조립을 관리한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "jts/config.hpp"
#include "jts/credential_validator.hpp"
#include "jts/issuance_engine.hpp"
#include "jts/observability.hpp"
#include "jts/session_store.hpp"
#include "jts/verification_engine.hpp"

namespace jts {

class Listener;

class ServerApp {
 public:
  // 키 로딩이나 저장소 스키마 준비에 실패하면 예외를 던진다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<IssuanceEngine> GetIssuanceEngine() { return issuance_; }
  std::shared_ptr<VerificationEngine> GetVerificationEngine() { return verifier_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void ScheduleSweep();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer sweep_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<DirectoryCredentialValidator> validator_;
  std::shared_ptr<IssuanceEngine> issuance_;
  std::shared_ptr<VerificationEngine> verifier_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace jts
