#include "security/JwkService.hpp"

#include "security/Algorithm.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using jwks::security::Algorithm;
using jwks::security::JwkService;
namespace JwsAlgorithm = jwks::security::JwsAlgorithm;
namespace JweAlgorithm = jwks::security::JweAlgorithm;

TEST(JwkServiceTest, KeyIdCarriesPrefix) {
  const auto sKid = JwkService::newKeyId("node1_");
  ASSERT_EQ(sKid.rfind("node1_", 0), 0u);
  // 16 random bytes are 22 unpadded base64url characters
  EXPECT_EQ(sKid.size(), std::string("node1_").size() + 22);
}

TEST(JwkServiceTest, KeyIdsAreUnique) {
  std::set<std::string> setKids;
  for (int i = 0; i < 200; ++i) {
    setKids.insert(JwkService::newKeyId("p_"));
  }
  EXPECT_EQ(setKids.size(), 200u);
}

TEST(JwkServiceTest, GeneratesRsaForRs) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::RS512, "t_");
  EXPECT_EQ(jwk.keyType(), "RSA");
  EXPECT_EQ(jwk.algorithm(), "RS512");
  EXPECT_EQ(jwk.use(), "sig");
  EXPECT_TRUE(jwk.hasPrivateKey());
  // 2048-bit modulus: 256 bytes, 342 base64url characters
  EXPECT_EQ(jwk.json()["n"].get<std::string>().size(), 342u);
}

TEST(JwkServiceTest, GeneratesEcOnAlgorithmCurve) {
  JwkService jks;
  EXPECT_EQ(jks.generate(JwsAlgorithm::ES256, "t_").json()["crv"], "P-256");
  EXPECT_EQ(jks.generate(JwsAlgorithm::ES384, "t_").json()["crv"], "P-384");
  EXPECT_EQ(jks.generate(JwsAlgorithm::ES512, "t_").json()["crv"], "P-521");
}

TEST(JwkServiceTest, GeneratesHmacSecretOfDigestLength) {
  JwkService jks;
  auto jwk = jks.generate(JwsAlgorithm::HS384, "t_");
  EXPECT_EQ(jwk.keyType(), "oct");
  EXPECT_EQ(jwk.symmetricKey().size(), 48u);
}

TEST(JwkServiceTest, EncryptionKeysAreRsaWithEncUse) {
  JwkService jks;
  auto jwk = jks.generate(JweAlgorithm::RsaOaep256Aes256Gcm, "t_");
  EXPECT_EQ(jwk.keyType(), "RSA");
  EXPECT_EQ(jwk.use(), "enc");
  EXPECT_EQ(jwk.algorithm(), "RSA-OAEP-256");
}

TEST(JwkServiceTest, EveryJwsAlgorithmProducesUsableKey) {
  JwkService jks;
  for (const char* pName : {"HS256", "HS512", "RS256", "PS384", "ES256", "ES512"}) {
    auto jwk = jks.generate(Algorithm::jws(pName), "t_");
    EXPECT_EQ(jwk.algorithm(), pName);
    if (!jwk.isSymmetric()) {
      EXPECT_FALSE(jwk.toPrivatePem().empty()) << pName;
    }
  }
}
