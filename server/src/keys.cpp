/*
 * 설명: OpenSSL EVP_PKEY로 키 생성, PEM 입출력, 공개키 추출을 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "jts/keys.hpp"

#include <functional>

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace jts {

namespace {
PkeyPtr Wrap(EVP_PKEY* raw) { return PkeyPtr(raw, EVP_PKEY_free); }

PkeyPtr Keygen(int type, const std::function<bool(EVP_PKEY_CTX*)>& configure) {
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(type, nullptr),
                                                                   EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 || !configure(ctx.get())) {
    throw KeyError("키 생성 컨텍스트 초기화 실패");
  }
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
    throw KeyError("키 생성 실패");
  }
  return Wrap(raw);
}

PkeyPtr ReadPrivatePem(const std::string& pem) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
                                                BIO_free);
  if (!bio) {
    throw KeyError("BIO 생성 실패");
  }
  EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!raw) {
    throw KeyError("개인키 PEM 파싱 실패");
  }
  return Wrap(raw);
}

PkeyPtr ReadPublicPem(const std::string& pem) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
                                                BIO_free);
  if (!bio) {
    throw KeyError("BIO 생성 실패");
  }
  EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (!raw) {
    throw KeyError("공개키 PEM 파싱 실패");
  }
  return Wrap(raw);
}

std::string DrainBio(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  return std::string(data, static_cast<std::size_t>(len));
}

void CheckKeyType(const PkeyPtr& pkey, SigningAlgorithm alg) {
  int id = EVP_PKEY_base_id(pkey.get());
  if (alg == SigningAlgorithm::kES256) {
    if (id != EVP_PKEY_EC || EVP_PKEY_bits(pkey.get()) != 256) {
      throw KeyError("ES256에는 P-256 EC 키가 필요합니다");
    }
  } else if (id != EVP_PKEY_RSA || EVP_PKEY_bits(pkey.get()) < 2048) {
    throw KeyError("RS256에는 2048비트 이상 RSA 키가 필요합니다");
  }
}
}  // namespace

std::string ToString(SigningAlgorithm alg) {
  switch (alg) {
    case SigningAlgorithm::kES256:
      return "ES256";
    case SigningAlgorithm::kRS256:
      return "RS256";
  }
  return "";
}

std::optional<SigningAlgorithm> ParseSigningAlgorithm(const std::string& name) {
  if (name == "ES256") {
    return SigningAlgorithm::kES256;
  }
  if (name == "RS256") {
    return SigningAlgorithm::kRS256;
  }
  return std::nullopt;
}

SigningKey GenerateSigningKey(const std::string& kid, SigningAlgorithm alg) {
  SigningKey key;
  key.kid = kid;
  key.alg = alg;
  key.has_private = true;
  if (alg == SigningAlgorithm::kES256) {
    key.pkey = Keygen(EVP_PKEY_EC, [](EVP_PKEY_CTX* ctx) {
      return EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) > 0;
    });
  } else {
    key.pkey = Keygen(EVP_PKEY_RSA, [](EVP_PKEY_CTX* ctx) { return EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048) > 0; });
  }
  return key;
}

EncryptionKey GenerateEncryptionKey(const std::string& kid, int rsa_bits) {
  EncryptionKey key;
  key.kid = kid;
  key.has_private = true;
  key.pkey = Keygen(EVP_PKEY_RSA,
                    [rsa_bits](EVP_PKEY_CTX* ctx) { return EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, rsa_bits) > 0; });
  return key;
}

SigningKey LoadSigningKeyPem(const std::string& kid, SigningAlgorithm alg, const std::string& pem) {
  SigningKey key;
  key.kid = kid;
  key.alg = alg;
  if (pem.find("PRIVATE KEY") != std::string::npos) {
    key.pkey = ReadPrivatePem(pem);
    key.has_private = true;
  } else {
    key.pkey = ReadPublicPem(pem);
  }
  CheckKeyType(key.pkey, alg);
  return key;
}

EncryptionKey LoadEncryptionKeyPem(const std::string& kid, const std::string& pem) {
  EncryptionKey key;
  key.kid = kid;
  if (pem.find("PRIVATE KEY") != std::string::npos) {
    key.pkey = ReadPrivatePem(pem);
    key.has_private = true;
  } else {
    key.pkey = ReadPublicPem(pem);
  }
  if (EVP_PKEY_base_id(key.pkey.get()) != EVP_PKEY_RSA) {
    throw KeyError("암호화 키는 RSA여야 합니다");
  }
  return key;
}

std::string PrivateKeyPem(const PkeyPtr& pkey) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw KeyError("개인키 PEM 직렬화 실패");
  }
  return DrainBio(bio.get());
}

std::string PublicKeyPem(const PkeyPtr& pkey) {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey.get()) != 1) {
    throw KeyError("공개키 PEM 직렬화 실패");
  }
  return DrainBio(bio.get());
}

SigningKey PublicOnly(const SigningKey& key) {
  SigningKey out;
  out.kid = key.kid;
  out.alg = key.alg;
  out.pkey = ReadPublicPem(PublicKeyPem(key.pkey));
  return out;
}

EncryptionKey PublicOnly(const EncryptionKey& key) {
  EncryptionKey out;
  out.kid = key.kid;
  out.pkey = ReadPublicPem(PublicKeyPem(key.pkey));
  return out;
}

KeyRing::KeyRing(std::initializer_list<SigningKey> keys) {
  for (const auto& key : keys) {
    Add(key);
  }
}

void KeyRing::Add(const SigningKey& key) { keys_[key.kid] = key; }

bool KeyRing::Remove(const std::string& kid) { return keys_.erase(kid) > 0; }

const SigningKey* KeyRing::Find(const std::string& kid) const {
  auto it = keys_.find(kid);
  if (it == keys_.end()) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace jts
