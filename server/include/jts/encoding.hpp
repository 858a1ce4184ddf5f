/*
 * 설명: base64url/hex 인코딩, 보안 난수, 상수 시간 비교, SHA-256 헬퍼를 제공한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jts {

using Bytes = std::vector<unsigned char>;

std::string Base64UrlEncode(const unsigned char* data, std::size_t len);
std::string Base64UrlEncode(std::string_view data);
std::string Base64UrlEncode(const Bytes& data);

// 패딩 없는 base64url만 허용한다. 알파벳 밖의 문자나 불가능한 길이는 nullopt.
std::optional<Bytes> Base64UrlDecode(std::string_view text);
std::optional<std::string> Base64UrlDecodeToString(std::string_view text);

std::string BytesToHex(const unsigned char* data, std::size_t len);

// OpenSSL CSPRNG. 실패 시 std::runtime_error.
Bytes RandomBytes(std::size_t count);
std::string RandomHex(std::size_t bytes);
std::string RandomBase64Url(std::size_t bytes);

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs);

std::string Sha256Hex(std::string_view input);

std::vector<std::string_view> SplitCompact(std::string_view token);

}  // namespace jts
