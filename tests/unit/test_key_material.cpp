#include "security/KeyMaterial.hpp"

#include "common/Errors.hpp"
#include "security/Algorithm.hpp"
#include "security/JwkService.hpp"

#include <gtest/gtest.h>

#include <chrono>

using jwks::common::KeyType;
using jwks::security::JwkService;
using jwks::security::KeyMaterial;
namespace JwsAlgorithm = jwks::security::JwsAlgorithm;
namespace JweAlgorithm = jwks::security::JweAlgorithm;
using namespace std::chrono_literals;

class KeyMaterialTest : public ::testing::Test {
 protected:
  JwkService _jks;
};

TEST_F(KeyMaterialTest, CreateCopiesKeyFields) {
  auto jwk = _jks.generate(JweAlgorithm::RsaOaepAes256Gcm, "km_");
  auto km = KeyMaterial::create(KeyType::Jwe, jwk, "A256GCM");

  EXPECT_EQ(km.sId.size(), 36u);
  EXPECT_EQ(km.sKeyId, jwk.keyId());
  EXPECT_EQ(km.eType, KeyType::Jwe);
  EXPECT_EQ(km.sAlgorithm, "RSA-OAEP");
  EXPECT_EQ(km.sEncryption, "A256GCM");
  EXPECT_FALSE(km.bRevoked);
  EXPECT_FALSE(km.oExpiredAt.has_value());
  EXPECT_LE(km.tpCreatedAt, std::chrono::system_clock::now());
}

TEST_F(KeyMaterialTest, ExpiresAfterConfiguredDays) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::ES256, "km_"));
  const auto tpCreated = km.tpCreatedAt;

  EXPECT_FALSE(km.isExpired(90, tpCreated + std::chrono::days(89)));
  EXPECT_FALSE(km.isExpired(90, tpCreated + std::chrono::days(90)));
  EXPECT_TRUE(km.isExpired(90, tpCreated + std::chrono::days(90) + 1s));
}

TEST_F(KeyMaterialTest, VeryLongLifetimeDoesNotExpireFreshKey) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::ES256, "km_"));
  const auto tpCreated = km.tpCreatedAt;

  EXPECT_FALSE(km.isExpired(200000, tpCreated));
  EXPECT_FALSE(km.isExpired(200000, tpCreated + std::chrono::years(10)));
  EXPECT_FALSE(km.isExpired(36500, tpCreated + std::chrono::days(36500)));
  EXPECT_TRUE(km.isExpired(36500, tpCreated + std::chrono::days(36500) + 1s));
}

TEST_F(KeyMaterialTest, ExplicitExpiryWins) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::ES256, "km_"));
  km.oExpiredAt = km.tpCreatedAt + 1h;
  EXPECT_FALSE(km.isExpired(90, km.tpCreatedAt + 30min));
  EXPECT_TRUE(km.isExpired(90, km.tpCreatedAt + 2h));
}

TEST_F(KeyMaterialTest, RevokeMarksExpiredNow) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::ES256, "km_"));
  km.revoke("compromised");

  EXPECT_TRUE(km.bRevoked);
  EXPECT_EQ(km.sRevokedReason, "compromised");
  ASSERT_TRUE(km.oExpiredAt.has_value());
  EXPECT_TRUE(km.isExpired(90, std::chrono::system_clock::now() + 1s));
}

TEST_F(KeyMaterialTest, RevokedKeyStillValidatesThroughPublicJwk) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::RS256, "km_"));
  km.revoke("rotated early");
  auto jwkPublic = km.publicJsonWebKey();
  EXPECT_FALSE(jwkPublic.hasPrivateKey());
  EXPECT_FALSE(jwkPublic.toPublicPem().empty());
}

TEST_F(KeyMaterialTest, JsonRoundTripKeepsState) {
  auto km = KeyMaterial::create(KeyType::Jwe, _jks.generate(JweAlgorithm::RsaOaepAes256Gcm, "km_"),
                                "A256GCM");
  km.revoke("test");

  nlohmann::json j = km;
  EXPECT_EQ(j["type"], "jwe");
  EXPECT_TRUE(j["expired_at"].is_number());

  auto kmBack = j.get<KeyMaterial>();
  EXPECT_EQ(kmBack.sId, km.sId);
  EXPECT_EQ(kmBack.sKeyId, km.sKeyId);
  EXPECT_EQ(kmBack.eType, KeyType::Jwe);
  EXPECT_EQ(kmBack.sEncryption, "A256GCM");
  EXPECT_EQ(kmBack.jParameters, km.jParameters);
  EXPECT_TRUE(kmBack.bRevoked);
  EXPECT_EQ(kmBack.tpCreatedAt, km.tpCreatedAt);
  EXPECT_EQ(kmBack.oExpiredAt, km.oExpiredAt);
}

TEST_F(KeyMaterialTest, FromJsonRejectsMissingFields) {
  nlohmann::json j = {{"id", "x"}, {"type", "jws"}};
  EXPECT_THROW(j.get<KeyMaterial>(), jwks::common::ValidationError);

  nlohmann::json jBadType = {{"id", "x"},          {"kid", "k"},       {"type", "jwt"},
                             {"alg", "ES256"},     {"parameters", {}}, {"created_at", 0}};
  EXPECT_THROW(jBadType.get<KeyMaterial>(), jwks::common::ValidationError);
}
