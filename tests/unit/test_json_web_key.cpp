#include "security/JsonWebKey.hpp"

#include "common/Errors.hpp"
#include "security/Algorithm.hpp"
#include "security/JwkService.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using jwks::common::ValidationError;
using jwks::security::JsonWebKey;
using jwks::security::JwkService;
namespace JwsAlgorithm = jwks::security::JwsAlgorithm;

namespace {

// RFC 7517 appendix A.1 public EC key
const nlohmann::json kRfcEcKey = {
    {"kty", "EC"},
    {"crv", "P-256"},
    {"x", "MKBCTNIcKUSDii11ySs3526iDZ8AiTo7Tu6KPAqv7D4"},
    {"y", "4Etl6SRW2YiLUrN5vfvVHuhp7x8PxltmWWlbbM4IFyM"},
    {"use", "enc"},
    {"kid", "1"}};

}  // namespace

TEST(JsonWebKeyTest, FromJsonKeepsMembers) {
  auto jwk = JsonWebKey::fromJson(kRfcEcKey);
  EXPECT_EQ(jwk.keyType(), "EC");
  EXPECT_EQ(jwk.keyId(), "1");
  EXPECT_EQ(jwk.use(), "enc");
  EXPECT_TRUE(jwk.algorithm().empty());
  EXPECT_FALSE(jwk.hasPrivateKey());
}

TEST(JsonWebKeyTest, PublicEcKeyConvertsToPem) {
  auto jwk = JsonWebKey::fromJson(kRfcEcKey);
  const auto sPem = jwk.toPublicPem();
  EXPECT_NE(sPem.find("BEGIN PUBLIC KEY"), std::string::npos);
  EXPECT_THROW(jwk.toPrivatePem(), ValidationError);
}

TEST(JsonWebKeyTest, RejectsMissingMembers) {
  EXPECT_THROW(JsonWebKey::fromJson(nlohmann::json::array()), ValidationError);
  EXPECT_THROW(JsonWebKey::fromJson({{"kty", "RSA"}, {"n", "AQAB"}}), ValidationError);
  EXPECT_THROW(JsonWebKey::fromJson({{"kty", "EC"}, {"crv", "P-256"}, {"x", "AA"}}),
               ValidationError);
  EXPECT_THROW(JsonWebKey::fromJson({{"kty", "oct"}}), ValidationError);
}

TEST(JsonWebKeyTest, RejectsPartialRsaPrivateKey) {
  nlohmann::json jKey = {{"kty", "RSA"}, {"n", "AQAB"}, {"e", "AQAB"}, {"d", "AQAB"}};
  EXPECT_THROW(JsonWebKey::fromJson(jKey), ValidationError);
}

TEST(JsonWebKeyTest, RejectsUnknownKtyAndCurve) {
  EXPECT_THROW(JsonWebKey::fromJson({{"kty", "OKP"}, {"crv", "Ed25519"}, {"x", "AA"}}),
               ValidationError);
  auto jKey = kRfcEcKey;
  jKey["crv"] = "P-192";
  EXPECT_THROW(JsonWebKey::fromJson(jKey), ValidationError);
}

TEST(JsonWebKeyTest, RejectsNonStringKid) {
  auto jKey = kRfcEcKey;
  jKey["kid"] = 42;
  EXPECT_THROW(JsonWebKey::fromJson(jKey), ValidationError);
}

TEST(JsonWebKeyTest, ToPublicStripsRsaPrivateMembers) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::RS256, "test_");
  ASSERT_TRUE(jwk.hasPrivateKey());

  auto jwkPublic = jwk.toPublic();
  EXPECT_FALSE(jwkPublic.hasPrivateKey());
  for (const char* pName : {"d", "p", "q", "dp", "dq", "qi"}) {
    EXPECT_FALSE(jwkPublic.json().contains(pName)) << pName;
  }
  EXPECT_EQ(jwkPublic.json()["n"], jwk.json()["n"]);
  EXPECT_EQ(jwkPublic.keyId(), jwk.keyId());
  EXPECT_EQ(jwkPublic.algorithm(), "RS256");
}

TEST(JsonWebKeyTest, ToPublicStripsEcPrivateMember) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::ES384, "test_");
  ASSERT_TRUE(jwk.json().contains("d"));
  EXPECT_FALSE(jwk.toPublic().json().contains("d"));
}

TEST(JsonWebKeyTest, EcCoordinatesArePaddedToFieldSize) {
  JwkService jks;
  // P-521 coordinates are 66 bytes, 88 base64url characters
  for (int i = 0; i < 4; ++i) {
    auto jwk = jks.generate(JwsAlgorithm::ES512, "test_");
    EXPECT_EQ(jwk.json()["x"].get<std::string>().size(), 88u);
    EXPECT_EQ(jwk.json()["y"].get<std::string>().size(), 88u);
    EXPECT_EQ(jwk.json()["d"].get<std::string>().size(), 88u);
  }
}

TEST(JsonWebKeyTest, SymmetricKeyHasNoPublicForm) {
  auto jwk = JsonWebKey::fromSymmetricKey({1, 2, 3, 4}, "k1", "HS256", "sig");
  EXPECT_TRUE(jwk.isSymmetric());
  EXPECT_TRUE(jwk.hasPrivateKey());
  EXPECT_EQ(jwk.symmetricKey(), (std::vector<unsigned char>{1, 2, 3, 4}));
  EXPECT_THROW(jwk.toPublic(), ValidationError);
  EXPECT_THROW(JsonWebKey::fromSymmetricKey({}, "k2", "HS256", "sig"), ValidationError);
}

TEST(JsonWebKeyTest, PrivateKeySurvivesJsonRoundTrip) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::PS256, "test_");
  auto jwkCopy = JsonWebKey::fromJson(nlohmann::json::parse(jwk.json().dump()));

  EXPECT_EQ(jwkCopy.toPrivatePem(), jwk.toPrivatePem());
  EXPECT_EQ(jwkCopy.toPublicPem(), jwk.toPublicPem());
}

TEST(JsonWebKeyTest, ToEvpPkeyPublicOnlyHasNoPrivateHalf) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::ES256, "test_");
  auto pPublic = jwk.toPublic().toEvpPkey(false);
  ASSERT_TRUE(pPublic);
  auto jwkBack = JsonWebKey::fromEvpPkey(pPublic.get(), "k", "ES256", "sig");
  EXPECT_FALSE(jwkBack.hasPrivateKey());
  EXPECT_EQ(jwkBack.json()["x"], jwk.json()["x"]);
  EXPECT_THROW(jwk.toPublic().toEvpPkey(true), ValidationError);
}
