/*
 * 설명: 데모 사용자 디렉터리의 비밀번호 해시 검증과 로그인 레이트리밋을 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/credential_validator_test.cpp
 */
#include "jts/credential_validator.hpp"

#include <vector>

#include <openssl/evp.h>

#include "jts/encoding.hpp"

namespace jts {

namespace {
bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto nibble = [](char c) -> int {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    };
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return true;
}
}  // namespace

RateLimiter::RateLimiter(std::size_t max_attempts, std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bucket = buckets_[key];
  if (bucket.window_start.time_since_epoch().count() == 0) {
    bucket.window_start = now;
  }
  auto elapsed = now - bucket.window_start;
  if (elapsed > window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_attempts_) {
    return false;
  }
  ++bucket.count;
  return true;
}

DirectoryCredentialValidator::DirectoryCredentialValidator(const DirectoryConfig& config)
    : config_(config), rate_limiter_(config.login_max_attempts, config.login_window) {}

bool DirectoryCredentialValidator::AddUser(const std::string& username, const std::string& password,
                                           const std::string& principal, const std::set<std::string>& permissions) {
  if (username.empty() || password.empty() || principal.empty()) {
    return false;
  }
  UserRecord rec;
  rec.principal = principal;
  rec.permissions = permissions;
  rec.salt_hex = RandomHex(16);
  rec.hash_hex = HashPassword(password, rec.salt_hex);
  if (rec.hash_hex.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return users_.emplace(username, rec).second;
}

std::optional<ValidatedPrincipal> DirectoryCredentialValidator::Validate(const RawCredentials& credentials) {
  if (!rate_limiter_.Allow(credentials.client_key, std::chrono::system_clock::now())) {
    return std::nullopt;
  }
  UserRecord rec;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(credentials.username);
    if (it == users_.end()) {
      return std::nullopt;
    }
    rec = it->second;
  }
  auto computed = HashPassword(credentials.password, rec.salt_hex);
  if (computed.empty() || !ConstantTimeEquals(computed, rec.hash_hex)) {
    return std::nullopt;
  }
  return ValidatedPrincipal{rec.principal, rec.permissions};
}

std::string DirectoryCredentialValidator::HashPassword(const std::string& password,
                                                       const std::string& salt_hex) const {
  std::vector<unsigned char> salt;
  if (!HexToBytes(salt_hex, salt)) {
    return {};
  }
  std::vector<unsigned char> output(32);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), config_.pbkdf2_iterations, EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    return {};
  }
  return BytesToHex(output.data(), output.size());
}

}  // namespace jts
