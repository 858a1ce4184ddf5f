/*
 * 설명: 서명/암호화용 비대칭 키와 kid 기반 키 링을 관리한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp, server/tests/unit/verification_engine_test.cpp
 */
#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <openssl/evp.h>

namespace jts {

enum class SigningAlgorithm { kES256, kRS256 };

std::string ToString(SigningAlgorithm alg);
std::optional<SigningAlgorithm> ParseSigningAlgorithm(const std::string& name);

using PkeyPtr = std::shared_ptr<EVP_PKEY>;

class KeyError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// 서명 키. 발급 측은 개인키를, 검증 측은 공개키만 가진다.
struct SigningKey {
  std::string kid;
  SigningAlgorithm alg{SigningAlgorithm::kES256};
  PkeyPtr pkey;
  bool has_private{false};
};

// RSA-OAEP 수신자 키. 발급 측은 공개키, 리소스 서버는 개인키를 가진다.
struct EncryptionKey {
  std::string kid;
  PkeyPtr pkey;
  bool has_private{false};
};

SigningKey GenerateSigningKey(const std::string& kid, SigningAlgorithm alg);
EncryptionKey GenerateEncryptionKey(const std::string& kid, int rsa_bits = 2048);

SigningKey LoadSigningKeyPem(const std::string& kid, SigningAlgorithm alg, const std::string& pem);
EncryptionKey LoadEncryptionKeyPem(const std::string& kid, const std::string& pem);

std::string PrivateKeyPem(const PkeyPtr& pkey);
std::string PublicKeyPem(const PkeyPtr& pkey);

SigningKey PublicOnly(const SigningKey& key);
EncryptionKey PublicOnly(const EncryptionKey& key);

class KeyRing {
 public:
  KeyRing() = default;
  explicit KeyRing(std::initializer_list<SigningKey> keys);

  void Add(const SigningKey& key);
  bool Remove(const std::string& kid);
  const SigningKey* Find(const std::string& kid) const;
  std::size_t Size() const { return keys_.size(); }

 private:
  std::unordered_map<std::string, SigningKey> keys_;
};

}  // namespace jts
