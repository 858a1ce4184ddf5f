/*
 * 설명: base64url/hex 인코딩과 OpenSSL 기반 난수, 해시, 비교를 구현한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "jts/encoding.hpp"

#include <array>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace jts {

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(-1);
  for (int i = 0; i < 64; ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = i;
  }
  return table;
}
}  // namespace

std::string Base64UrlEncode(const unsigned char* data, std::size_t len) {
  std::string out;
  out.reserve((len * 4 + 2) / 3);
  std::size_t i = 0;
  for (; i + 2 < len; i += 3) {
    unsigned int chunk = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
    out.push_back(kAlphabet[chunk & 0x3F]);
  }
  std::size_t rest = len - i;
  if (rest == 1) {
    unsigned int chunk = data[i] << 16;
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
  } else if (rest == 2) {
    unsigned int chunk = (data[i] << 16) | (data[i + 1] << 8);
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
  }
  return out;
}

std::string Base64UrlEncode(std::string_view data) {
  return Base64UrlEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string Base64UrlEncode(const Bytes& data) { return Base64UrlEncode(data.data(), data.size()); }

std::optional<Bytes> Base64UrlDecode(std::string_view text) {
  static const std::array<int, 256> table = BuildDecodeTable();
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  Bytes out;
  out.reserve(text.size() * 3 / 4);
  unsigned int acc = 0;
  int bits = 0;
  for (char ch : text) {
    int value = table[static_cast<unsigned char>(ch)];
    if (value < 0) {
      return std::nullopt;
    }
    acc = (acc << 6) | static_cast<unsigned int>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<unsigned char>((acc >> bits) & 0xFF));
    }
  }
  // 남은 비트가 0이 아니면 정규 인코딩이 아니다.
  if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> Base64UrlDecodeToString(std::string_view text) {
  auto bytes = Base64UrlDecode(text);
  if (!bytes) {
    return std::nullopt;
  }
  return std::string(bytes->begin(), bytes->end());
}

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(hex[(data[i] >> 4) & 0xF]);
    out.push_back(hex[data[i] & 0xF]);
  }
  return out;
}

Bytes RandomBytes(std::size_t count) {
  Bytes buffer(count);
  if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패");
  }
  return buffer;
}

std::string RandomHex(std::size_t bytes) {
  auto buffer = RandomBytes(bytes);
  return BytesToHex(buffer.data(), buffer.size());
}

std::string RandomBase64Url(std::size_t bytes) { return Base64UrlEncode(RandomBytes(bytes)); }

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string Sha256Hex(std::string_view input) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int len = 0;
  if (EVP_Digest(input.data(), input.size(), hash, &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 계산 실패");
  }
  return BytesToHex(hash, len);
}

std::vector<std::string_view> SplitCompact(std::string_view token) {
  std::vector<std::string_view> parts;
  std::size_t pos = 0;
  while (true) {
    auto dot = token.find('.', pos);
    if (dot == std::string_view::npos) {
      parts.push_back(token.substr(pos));
      break;
    }
    parts.push_back(token.substr(pos, dot - pos));
    pos = dot + 1;
  }
  return parts;
}

}  // namespace jts
