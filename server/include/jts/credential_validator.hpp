/*
 * 설명: 로그인 시 자격 증명을 주체로 바꾸는 포트와 데모용 사용자 디렉터리, 레이트리밋.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/credential_validator_test.cpp
 */
#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace jts {

struct RawCredentials {
  std::string username;
  std::string password;
  // 레이트리밋 키. 보통 원격 IP.
  std::string client_key;
};

struct ValidatedPrincipal {
  std::string principal;
  std::set<std::string> permissions;
};

class CredentialValidator {
 public:
  virtual ~CredentialValidator() = default;
  virtual std::optional<ValidatedPrincipal> Validate(const RawCredentials& credentials) = 0;
};

class RateLimiter {
 public:
  RateLimiter(std::size_t max_attempts, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::system_clock::time_point now);

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::system_clock::time_point window_start{};
  };
  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_attempts_;
  std::chrono::seconds window_;
  std::mutex mutex_;
};

struct DirectoryConfig {
  std::size_t login_max_attempts{5};
  std::chrono::seconds login_window{std::chrono::seconds(60)};
  int pbkdf2_iterations{100000};
};

// PBKDF2-HMAC-SHA256 해시를 보관하는 메모리 디렉터리.
class DirectoryCredentialValidator : public CredentialValidator {
 public:
  explicit DirectoryCredentialValidator(const DirectoryConfig& config);

  bool AddUser(const std::string& username, const std::string& password, const std::string& principal,
               const std::set<std::string>& permissions);
  std::optional<ValidatedPrincipal> Validate(const RawCredentials& credentials) override;

 private:
  struct UserRecord {
    std::string principal;
    std::set<std::string> permissions;
    std::string salt_hex;
    std::string hash_hex;
  };

  std::string HashPassword(const std::string& password, const std::string& salt_hex) const;

  DirectoryConfig config_;
  RateLimiter rate_limiter_;
  std::unordered_map<std::string, UserRecord> users_;
  std::mutex mutex_;
};

}  // namespace jts
