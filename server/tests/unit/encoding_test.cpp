#include <gtest/gtest.h>

#include "jts/encoding.hpp"

namespace {

TEST(EncodingTest, Base64UrlMatchesKnownVectors) {
  EXPECT_EQ(jts::Base64UrlEncode(std::string_view("")), "");
  EXPECT_EQ(jts::Base64UrlEncode(std::string_view("f")), "Zg");
  EXPECT_EQ(jts::Base64UrlEncode(std::string_view("fo")), "Zm8");
  EXPECT_EQ(jts::Base64UrlEncode(std::string_view("foo")), "Zm9v");
  jts::Bytes raw{0xfb, 0xff, 0xbf};
  EXPECT_EQ(jts::Base64UrlEncode(raw), "-_-_");
  EXPECT_EQ(jts::Base64UrlDecodeToString("Zm9vYmE"), std::optional<std::string>("fooba"));
}

TEST(EncodingTest, StrictDecodeRejectsPaddingAndForeignAlphabet) {
  EXPECT_FALSE(jts::Base64UrlDecode("Zg==").has_value());
  EXPECT_FALSE(jts::Base64UrlDecode("+/+/").has_value());
  EXPECT_FALSE(jts::Base64UrlDecode("Z").has_value());
  EXPECT_FALSE(jts::Base64UrlDecode("Zh").has_value());
}

TEST(EncodingTest, RandomValuesHaveExpectedLength) {
  EXPECT_EQ(jts::RandomBytes(32).size(), 32u);
  EXPECT_EQ(jts::RandomHex(16).size(), 32u);
  EXPECT_EQ(jts::RandomBase64Url(32).size(), 43u);
  EXPECT_NE(jts::RandomBase64Url(32), jts::RandomBase64Url(32));
}

TEST(EncodingTest, ConstantTimeEqualsAndDigest) {
  EXPECT_TRUE(jts::ConstantTimeEquals("abc", "abc"));
  EXPECT_FALSE(jts::ConstantTimeEquals("abc", "abd"));
  EXPECT_FALSE(jts::ConstantTimeEquals("abc", "abcd"));
  EXPECT_EQ(jts::Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodingTest, SplitCompactKeepsEmptySegments) {
  auto parts = jts::SplitCompact("a..c");
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[1], "");
}

}  // namespace
