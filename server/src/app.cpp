/*
 * 설명: 서버 수명주기, 리스닝, 만료 세션 정리 타이머를 관리한다.
 * 버전: v1.0.0
 * 테스트: server/tests/e2e/auth_flow_test.cpp
 */
#include "jts/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "jts/claims.hpp"
#include "jts/db_client.hpp"
#include "jts/http_session.hpp"
#include "jts/in_memory_session_store.hpp"
#include "jts/mariadb_session_store.hpp"

namespace jts {
namespace {
std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("키 파일을 열 수 없습니다: " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

SigningKey LoadOrGenerateSigningKey(const AppConfig& config) {
  auto alg = ParseSigningAlgorithm(config.signing_alg);
  if (!alg) {
    throw std::invalid_argument("지원하지 않는 서명 알고리즘입니다: " + config.signing_alg);
  }
  if (config.signing_key_pem.empty()) {
    return GenerateSigningKey(config.signing_kid, *alg);
  }
  return LoadSigningKeyPem(config.signing_kid, *alg, ReadFile(config.signing_key_pem));
}

EncryptionKey LoadOrGenerateEncryptionKey(const AppConfig& config) {
  if (config.encryption_key_pem.empty()) {
    return GenerateEncryptionKey(config.encryption_kid);
  }
  return LoadEncryptionKeyPem(config.encryption_kid, ReadFile(config.encryption_key_pem));
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<IssuanceEngine> issuance, std::shared_ptr<VerificationEngine> verifier,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), issuance_(std::move(issuance)),
        verifier_(std::move(verifier)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->issuance_, self->verifier_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<IssuanceEngine> issuance_;
  std::shared_ptr<VerificationEngine> verifier_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), sweep_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  std::chrono::milliseconds store_timeout(config.store_timeout_ms);

  if (config.session_store == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto mariadb_store = std::make_shared<MariaDbSessionStore>(std::make_shared<MariaDbClient>(db_config));
    mariadb_store->EnsureSchema(store_timeout);
    store_ = mariadb_store;
  } else if (config.session_store == "memory") {
    store_ = std::make_shared<InMemorySessionStore>();
  } else {
    throw std::invalid_argument("SESSION_STORE는 memory 또는 mariadb여야 합니다: " + config.session_store);
  }

  DirectoryConfig directory_config;
  directory_config.login_max_attempts = config.login_rate_limit_max;
  directory_config.login_window = std::chrono::seconds(config.login_rate_window_seconds);
  validator_ = std::make_shared<DirectoryCredentialValidator>(directory_config);
  if (!config.demo_user_email.empty() && !config.demo_user_password.empty()) {
    validator_->AddUser(config.demo_user_email, config.demo_user_password, config.demo_user_email,
                        {"profile:read", "sessions:manage"});
  }

  bool confidential = config.profile == kConfidentialProfile;
  if (!confidential && config.profile != kSignedProfile) {
    throw std::invalid_argument("JTS_PROFILE은 JTS-S/v1 또는 JTS-C/v1이어야 합니다: " + config.profile);
  }

  IssuanceConfig issuance_config;
  issuance_config.signing_key = LoadOrGenerateSigningKey(config);
  issuance_config.audience = config.audience;
  issuance_config.bearer_ttl = std::chrono::seconds(config.bearer_ttl_seconds);
  issuance_config.session_ttl = std::chrono::seconds(config.session_ttl_seconds);
  issuance_config.grace_window = std::chrono::seconds(config.grace_window_seconds);
  issuance_config.store_timeout = store_timeout;
  issuance_config.max_sessions_per_principal = config.max_sessions_per_principal;

  VerifierConfig verifier_config;
  verifier_config.expected_audience = config.audience;
  verifier_config.clock_skew = std::chrono::seconds(config.clock_skew_seconds);
  verifier_config.require_encryption = confidential;
  if (confidential) {
    auto encryption_key = LoadOrGenerateEncryptionKey(config);
    issuance_config.encryption_recipient = PublicOnly(encryption_key);
    verifier_config.decryption_key = encryption_key;
  }

  issuance_ = std::make_shared<IssuanceEngine>(issuance_config, store_, validator_, observability_);
  verifier_config.accepted_keys = issuance_->PublicKeyRing();
  verifier_ = std::make_shared<VerificationEngine>(verifier_config, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, issuance_, verifier_, observability_);
    listener_->Run();
    ScheduleSweep();
    observability_->Log(LogContext{"startup", "server_started", LogLevel::kInfo, std::nullopt, std::nullopt,
                                   std::nullopt, 0});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::ScheduleSweep() {
  if (config_.sweep_interval_seconds == 0) {
    return;
  }
  sweep_timer_.expires_after(std::chrono::seconds(config_.sweep_interval_seconds));
  sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    AuthError error;
    auto removed = issuance_->SweepExpired(error);
    if (!removed) {
      observability_->Log(LogContext{observability_->NextTraceId(), "session_sweep_failed", LogLevel::kWarn,
                                     std::nullopt, std::nullopt, ToWireCode(error.code), 0});
    }
    ScheduleSweep();
  });
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  sweep_timer_.cancel();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "3000")));
  cfg.session_store = get_env("SESSION_STORE", "memory");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.profile = get_env("JTS_PROFILE", kSignedProfile);
  cfg.audience = get_env("JTS_AUDIENCE", "jts-demo-api");
  cfg.signing_alg = get_env("JTS_SIGNING_ALG", "ES256");
  cfg.signing_kid = get_env("JTS_SIGNING_KID", "auth-server-key-1");
  cfg.signing_key_pem = get_env("JTS_SIGNING_KEY_PEM", "");
  cfg.encryption_kid = get_env("JTS_ENCRYPTION_KID", "resource-server-enc-1");
  cfg.encryption_key_pem = get_env("JTS_ENCRYPTION_KEY_PEM", "");
  cfg.bearer_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("BEARER_TTL_SECONDS", "300")));
  cfg.session_ttl_seconds = static_cast<std::size_t>(std::stoul(get_env("SESSION_TTL_SECONDS", "604800")));
  cfg.grace_window_seconds = static_cast<std::size_t>(std::stoul(get_env("GRACE_WINDOW_SECONDS", "10")));
  cfg.clock_skew_seconds = static_cast<std::size_t>(std::stoul(get_env("CLOCK_SKEW_SECONDS", "30")));
  cfg.store_timeout_ms = static_cast<std::size_t>(std::stoul(get_env("STORE_TIMEOUT_MS", "2000")));
  cfg.max_sessions_per_principal = static_cast<std::size_t>(std::stoul(get_env("MAX_SESSIONS_PER_PRINCIPAL", "0")));
  cfg.login_rate_window_seconds = static_cast<std::size_t>(std::stoul(get_env("LOGIN_RATE_LIMIT_WINDOW", "60")));
  cfg.login_rate_limit_max = static_cast<std::size_t>(std::stoul(get_env("LOGIN_RATE_LIMIT_MAX", "5")));
  cfg.sweep_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("SESSION_SWEEP_INTERVAL_SECONDS", "60")));
  cfg.demo_user_email = get_env("DEMO_USER_EMAIL", "test@example.com");
  cfg.demo_user_password = get_env("DEMO_USER_PASSWORD", "password123");
  return cfg;
}

}  // namespace jts
