/*
 * 설명: JWS(ES256/RS256) 서명과 JWE(RSA-OAEP-256 + A256GCM) 봉투 암호화를 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "jts/token_codec.hpp"

#include <memory>
#include <string_view>
#include <vector>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include "jts/encoding.hpp"

namespace jts {

namespace {
constexpr std::size_t kContentKeyBytes = 32;
constexpr std::size_t kIvBytes = 12;
constexpr std::size_t kTagBytes = 16;
constexpr std::size_t kEs256CoordinateBytes = 32;
constexpr const char* kKeyWrapAlg = "RSA-OAEP-256";
constexpr const char* kContentEnc = "A256GCM";

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

VerificationResult Fail(VerificationFailure failure, std::string detail) {
  VerificationResult result;
  result.failure = failure;
  result.detail = std::move(detail);
  return result;
}

std::string StringField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::optional<nlohmann::json> ParseSegmentJson(std::string_view segment) {
  auto text = Base64UrlDecodeToString(segment);
  if (!text) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(*text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

Bytes DerToRawEcdsa(const Bytes& der) {
  const unsigned char* p = der.data();
  EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())), ECDSA_SIG_free);
  if (!sig) {
    throw TokenCodecError("ECDSA 서명 DER 파싱 실패");
  }
  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);
  Bytes raw(kEs256CoordinateBytes * 2);
  if (BN_bn2binpad(r, raw.data(), kEs256CoordinateBytes) < 0 ||
      BN_bn2binpad(s, raw.data() + kEs256CoordinateBytes, kEs256CoordinateBytes) < 0) {
    throw TokenCodecError("ECDSA 서명 변환 실패");
  }
  return raw;
}

std::optional<Bytes> RawToDerEcdsa(const Bytes& raw) {
  if (raw.size() != kEs256CoordinateBytes * 2) {
    return std::nullopt;
  }
  EcdsaSigPtr sig(ECDSA_SIG_new(), ECDSA_SIG_free);
  BIGNUM* r = BN_bin2bn(raw.data(), kEs256CoordinateBytes, nullptr);
  BIGNUM* s = BN_bin2bn(raw.data() + kEs256CoordinateBytes, kEs256CoordinateBytes, nullptr);
  if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }
  int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }
  Bytes der(static_cast<std::size_t>(len));
  unsigned char* p = der.data();
  i2d_ECDSA_SIG(sig.get(), &p);
  return der;
}

Bytes Sign(const SigningKey& key, std::string_view input) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.pkey.get()) != 1) {
    throw TokenCodecError("서명 컨텍스트 초기화 실패");
  }
  std::size_t len = 0;
  auto data = reinterpret_cast<const unsigned char*>(input.data());
  if (EVP_DigestSign(ctx.get(), nullptr, &len, data, input.size()) != 1) {
    throw TokenCodecError("서명 길이 계산 실패");
  }
  Bytes signature(len);
  if (EVP_DigestSign(ctx.get(), signature.data(), &len, data, input.size()) != 1) {
    throw TokenCodecError("서명 실패");
  }
  signature.resize(len);
  if (key.alg == SigningAlgorithm::kES256) {
    return DerToRawEcdsa(signature);
  }
  return signature;
}

bool VerifySignature(const SigningKey& key, std::string_view input, const Bytes& signature) {
  Bytes encoded = signature;
  if (key.alg == SigningAlgorithm::kES256) {
    auto der = RawToDerEcdsa(signature);
    if (!der) {
      return false;
    }
    encoded = std::move(*der);
  }
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.pkey.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), encoded.data(), encoded.size(),
                          reinterpret_cast<const unsigned char*>(input.data()), input.size()) == 1;
}

PkeyCtxPtr OaepContext(const EncryptionKey& key, bool decrypt) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key.pkey.get(), nullptr), EVP_PKEY_CTX_free);
  if (!ctx) {
    return PkeyCtxPtr(nullptr, EVP_PKEY_CTX_free);
  }
  int init = decrypt ? EVP_PKEY_decrypt_init(ctx.get()) : EVP_PKEY_encrypt_init(ctx.get());
  if (init <= 0 || EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) <= 0) {
    return PkeyCtxPtr(nullptr, EVP_PKEY_CTX_free);
  }
  return ctx;
}

Bytes WrapContentKey(const EncryptionKey& recipient, const Bytes& cek) {
  auto ctx = OaepContext(recipient, false);
  if (!ctx) {
    throw TokenCodecError("RSA-OAEP 컨텍스트 초기화 실패");
  }
  std::size_t len = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &len, cek.data(), cek.size()) <= 0) {
    throw TokenCodecError("콘텐츠 키 래핑 길이 계산 실패");
  }
  Bytes wrapped(len);
  if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &len, cek.data(), cek.size()) <= 0) {
    throw TokenCodecError("콘텐츠 키 래핑 실패");
  }
  wrapped.resize(len);
  return wrapped;
}

std::optional<Bytes> UnwrapContentKey(const EncryptionKey& key, const Bytes& wrapped) {
  auto ctx = OaepContext(key, true);
  if (!ctx) {
    return std::nullopt;
  }
  std::size_t len = 0;
  if (EVP_PKEY_decrypt(ctx.get(), nullptr, &len, wrapped.data(), wrapped.size()) <= 0) {
    return std::nullopt;
  }
  Bytes cek(len);
  if (EVP_PKEY_decrypt(ctx.get(), cek.data(), &len, wrapped.data(), wrapped.size()) <= 0) {
    return std::nullopt;
  }
  cek.resize(len);
  if (cek.size() != kContentKeyBytes) {
    return std::nullopt;
  }
  return cek;
}

void GcmEncrypt(const Bytes& key, const Bytes& iv, std::string_view aad, std::string_view plaintext, Bytes& ciphertext,
                Bytes& tag) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  int len = 0;
  if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1 ||
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    throw TokenCodecError("AES-GCM 초기화 실패");
  }
  ciphertext.assign(plaintext.size() + kTagBytes, 0);
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw TokenCodecError("AES-GCM 암호화 실패");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
    throw TokenCodecError("AES-GCM 종료 실패");
  }
  total += len;
  ciphertext.resize(static_cast<std::size_t>(total));
  tag.assign(kTagBytes, 0);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes), tag.data()) != 1) {
    throw TokenCodecError("AES-GCM 태그 추출 실패");
  }
}

std::optional<std::string> GcmDecrypt(const Bytes& key, const Bytes& iv, std::string_view aad,
                                      const Bytes& ciphertext, Bytes tag) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  int len = 0;
  if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1 ||
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }
  Bytes plaintext(ciphertext.size() + kTagBytes, 0);
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(), static_cast<int>(ciphertext.size())) !=
      1) {
    return std::nullopt;
  }
  int total = len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
    return std::nullopt;
  }
  // 태그 불일치 시 평문은 버린다.
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
    return std::nullopt;
  }
  total += len;
  return std::string(plaintext.begin(), plaintext.begin() + total);
}

std::string SignCompact(const nlohmann::json& payload, const SigningKey& key) {
  nlohmann::json header{{"alg", ToString(key.alg)}, {"kid", key.kid}, {"typ", kSignedProfile}};
  std::string signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
  auto signature = Sign(key, signing_input);
  return signing_input + "." + Base64UrlEncode(signature);
}

std::string EncryptCompact(const std::string& plaintext, const EncryptionKey& recipient) {
  nlohmann::json header{{"alg", kKeyWrapAlg},
                        {"enc", kContentEnc},
                        {"kid", recipient.kid},
                        {"typ", kConfidentialProfile},
                        {"cty", kSignedProfile}};
  std::string header_enc = Base64UrlEncode(header.dump());
  Bytes cek = RandomBytes(kContentKeyBytes);
  Bytes iv = RandomBytes(kIvBytes);
  Bytes wrapped = WrapContentKey(recipient, cek);
  Bytes ciphertext;
  Bytes tag;
  GcmEncrypt(cek, iv, header_enc, plaintext, ciphertext, tag);
  OPENSSL_cleanse(cek.data(), cek.size());
  return header_enc + "." + Base64UrlEncode(wrapped) + "." + Base64UrlEncode(iv) + "." +
         Base64UrlEncode(ciphertext) + "." + Base64UrlEncode(tag);
}

// 성공 시 내부 JWS를, 실패 시 failure가 채워진 결과를 돌려준다.
std::optional<std::string> DecryptCompact(const std::vector<std::string_view>& parts, const EncryptionKey* key,
                                          VerificationResult& failure) {
  if (!key || !key->pkey || !key->has_private) {
    failure = Fail(VerificationFailure::kDecryptionFailed, "복호화 키가 구성되지 않았습니다");
    return std::nullopt;
  }
  auto header = ParseSegmentJson(parts[0]);
  if (!header) {
    failure = Fail(VerificationFailure::kMalformed, "JWE 헤더가 올바르지 않습니다");
    return std::nullopt;
  }
  if (StringField(*header, "alg") != kKeyWrapAlg || StringField(*header, "enc") != kContentEnc) {
    failure = Fail(VerificationFailure::kMalformed, "지원하지 않는 JWE 알고리즘입니다");
    return std::nullopt;
  }
  if (header->contains("kid") && StringField(*header, "kid") != key->kid) {
    failure = Fail(VerificationFailure::kUnknownKey, "알 수 없는 수신자 키입니다");
    return std::nullopt;
  }
  auto wrapped = Base64UrlDecode(parts[1]);
  auto iv = Base64UrlDecode(parts[2]);
  auto ciphertext = Base64UrlDecode(parts[3]);
  auto tag = Base64UrlDecode(parts[4]);
  if (!wrapped || !iv || !ciphertext || !tag || iv->size() != kIvBytes || tag->size() != kTagBytes) {
    failure = Fail(VerificationFailure::kMalformed, "JWE 세그먼트가 올바르지 않습니다");
    return std::nullopt;
  }
  auto cek = UnwrapContentKey(*key, *wrapped);
  if (!cek) {
    failure = Fail(VerificationFailure::kDecryptionFailed, "콘텐츠 키 복호화 실패");
    return std::nullopt;
  }
  auto plaintext = GcmDecrypt(*cek, *iv, parts[0], *ciphertext, *tag);
  OPENSSL_cleanse(cek->data(), cek->size());
  if (!plaintext) {
    failure = Fail(VerificationFailure::kDecryptionFailed, "인증 태그 검증 실패");
    return std::nullopt;
  }
  return plaintext;
}

VerificationResult VerifySignedCompact(const std::string& jws, const KeyRing& accepted_keys,
                                       const VerifyOptions& options) {
  auto parts = SplitCompact(jws);
  if (parts.size() != 3) {
    return Fail(VerificationFailure::kMalformed, "JWS 세그먼트 수가 올바르지 않습니다");
  }
  auto header = ParseSegmentJson(parts[0]);
  if (!header || !header->contains("alg") || !(*header)["alg"].is_string() || !header->contains("kid") ||
      !(*header)["kid"].is_string()) {
    return Fail(VerificationFailure::kMalformed, "JWS 헤더가 올바르지 않습니다");
  }
  if (header->contains("typ") && StringField(*header, "typ") != kSignedProfile) {
    return Fail(VerificationFailure::kMalformed, "지원하지 않는 토큰 프로파일입니다");
  }
  std::string kid = (*header)["kid"].get<std::string>();
  auto payload = ParseSegmentJson(parts[1]);
  if (!payload) {
    return Fail(VerificationFailure::kMalformed, "페이로드가 올바르지 않습니다");
  }
  auto claims = ClaimsFromJson(*payload);
  if (!claims) {
    return Fail(VerificationFailure::kMalformed, "필수 클레임이 없습니다");
  }
  claims->key_id = kid;

  // 만료 판정은 서명 유효성과 무관하게 먼저 내린다. 만료되지 않은 토큰은 모두 서명 검증을 거친다.
  auto now = std::chrono::duration_cast<std::chrono::seconds>(options.now.time_since_epoch()).count();
  if (now > claims->expires_at + options.clock_skew.count()) {
    return Fail(VerificationFailure::kExpired, "토큰이 만료되었습니다");
  }

  const SigningKey* key = accepted_keys.Find(kid);
  if (!key) {
    return Fail(VerificationFailure::kUnknownKey, "알 수 없는 서명 키입니다: " + kid);
  }
  auto alg = ParseSigningAlgorithm((*header)["alg"].get<std::string>());
  if (!alg || *alg != key->alg) {
    return Fail(VerificationFailure::kSignatureInvalid, "헤더 알고리즘이 키와 일치하지 않습니다");
  }
  auto signature = Base64UrlDecode(parts[2]);
  if (!signature) {
    return Fail(VerificationFailure::kMalformed, "서명 인코딩이 올바르지 않습니다");
  }
  std::string_view signing_input(jws.data(), parts[0].size() + 1 + parts[1].size());
  if (!VerifySignature(*key, signing_input, *signature)) {
    return Fail(VerificationFailure::kSignatureInvalid, "서명 검증 실패");
  }
  if (claims->issued_at > now) {
    return Fail(VerificationFailure::kMalformed, "발급 시각이 미래입니다");
  }
  if (options.expected_audience && claims->audience != *options.expected_audience) {
    return Fail(VerificationFailure::kAudienceMismatch, "audience가 일치하지 않습니다");
  }
  VerificationResult result;
  result.claims = std::move(claims);
  return result;
}
}  // namespace

std::string ToString(VerificationFailure failure) {
  switch (failure) {
    case VerificationFailure::kNone:
      return "none";
    case VerificationFailure::kExpired:
      return "expired";
    case VerificationFailure::kAudienceMismatch:
      return "audience_mismatch";
    case VerificationFailure::kUnknownKey:
      return "unknown_key";
    case VerificationFailure::kMalformed:
      return "malformed";
    case VerificationFailure::kSignatureInvalid:
      return "signature_invalid";
    case VerificationFailure::kDecryptionFailed:
      return "decryption_failed";
  }
  return "unknown";
}

std::string IssueToken(const BearerPassClaims& claims, const SigningKey& signing_key, const EncryptionKey* recipient) {
  if (claims.principal.empty()) {
    throw TokenCodecError("prn 클레임이 필요합니다");
  }
  if (claims.expires_at <= 0) {
    throw TokenCodecError("exp 클레임이 필요합니다");
  }
  if (!signing_key.pkey || !signing_key.has_private) {
    throw TokenCodecError("서명 개인키가 없습니다: " + signing_key.kid);
  }
  BearerPassClaims to_sign = claims;
  if (to_sign.token_id.empty()) {
    to_sign.token_id = RandomBase64Url(16);
  }
  std::string jws = SignCompact(ToJson(to_sign), signing_key);
  if (!recipient) {
    return jws;
  }
  if (!recipient->pkey) {
    throw TokenCodecError("수신자 공개키가 없습니다: " + recipient->kid);
  }
  return EncryptCompact(jws, *recipient);
}

VerificationResult VerifyToken(const std::string& token, const KeyRing& accepted_keys,
                               const EncryptionKey* decryption_key, const VerifyOptions& options) {
  auto parts = SplitCompact(token);
  if (parts.size() == 5) {
    VerificationResult failure;
    auto inner = DecryptCompact(parts, decryption_key, failure);
    if (!inner) {
      return failure;
    }
    return VerifySignedCompact(*inner, accepted_keys, options);
  }
  if (parts.size() == 3) {
    if (options.require_encryption) {
      return Fail(VerificationFailure::kMalformed, "암호화되지 않은 토큰은 허용되지 않습니다");
    }
    return VerifySignedCompact(token, accepted_keys, options);
  }
  return Fail(VerificationFailure::kMalformed, "토큰 형식이 올바르지 않습니다");
}

}  // namespace jts
