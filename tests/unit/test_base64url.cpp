#include "security/Base64Url.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace b64 = jwks::security::base64url;

TEST(Base64UrlTest, EncodesWithoutPadding) {
  EXPECT_EQ(b64::encode(std::string("f")), "Zg");
  EXPECT_EQ(b64::encode(std::string("fo")), "Zm8");
  EXPECT_EQ(b64::encode(std::string("foo")), "Zm9v");
  EXPECT_EQ(b64::encode(std::string("")), "");
}

TEST(Base64UrlTest, UsesUrlSafeAlphabet) {
  const std::vector<unsigned char> vBytes = {0xfb, 0xff, 0xbf};
  EXPECT_EQ(b64::encode(vBytes), "-_-_");
}

TEST(Base64UrlTest, DecodesWithAndWithoutPadding) {
  EXPECT_EQ(b64::decode("Zm8"), "fo");
  EXPECT_EQ(b64::decode("Zm8="), "fo");
  EXPECT_EQ(b64::decode("Zg"), "f");
  EXPECT_EQ(b64::decode("Zg=="), "f");
}

TEST(Base64UrlTest, DecodesJwtHeader) {
  EXPECT_EQ(b64::decode("eyJhbGciOiJub25lIn0"), R"({"alg":"none"})");
}

TEST(Base64UrlTest, DecodeBytesKeepsBinary) {
  const std::vector<unsigned char> vBytes = {0x00, 0x01, 0xfe, 0xff, 0x00};
  EXPECT_EQ(b64::decodeBytes(b64::encode(vBytes)), vBytes);
}

TEST(Base64UrlTest, RejectsStandardAlphabet) {
  EXPECT_THROW(b64::decode("+/+/"), jwks::common::ValidationError);
}

TEST(Base64UrlTest, RejectsImpossibleLength) {
  EXPECT_THROW(b64::decode("Zm9vY"), jwks::common::ValidationError);
}

TEST(Base64UrlTest, RejectsForeignCharacters) {
  EXPECT_THROW(b64::decode("Zm9v!A"), jwks::common::ValidationError);
}
