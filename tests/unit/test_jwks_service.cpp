#include "core/JwksService.hpp"

#include "common/Errors.hpp"
#include "security/JwtHandler.hpp"
#include "store/InMemoryStore.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using jwks::common::KeyType;
using jwks::core::JwksOptions;
using jwks::core::JwksService;
using jwks::security::Algorithm;
using jwks::security::JwkService;
using jwks::security::JwtHandler;
using jwks::security::KeyMaterial;
using jwks::security::TokenDescriptor;
using jwks::security::TokenValidationParameters;
using jwks::store::InMemoryStore;
namespace JwsAlgorithm = jwks::security::JwsAlgorithm;
namespace JweAlgorithm = jwks::security::JweAlgorithm;

namespace {

class JwksServiceTest : public ::testing::Test {
 protected:
  InMemoryStore _store;
  JwkService _jks;
  JwksService _js{_store, _jks};
};

}  // namespace

TEST_F(JwksServiceTest, GeneratesDefaultSigningKey) {
  const auto sc = _js.generateSigningCredentials();
  EXPECT_EQ(sc.sAlgorithm, "ES256");
  EXPECT_EQ(sc.jwkKey.keyType(), "EC");
  EXPECT_TRUE(sc.jwkKey.hasPrivateKey());
  EXPECT_EQ(sc.sKid, sc.jwkKey.keyId());
  EXPECT_EQ(sc.sKid.rfind(_js.options().sKeyPrefix, 0), 0u);
}

TEST_F(JwksServiceTest, CurrentSigningIsStableAcrossCalls) {
  std::set<std::string> setKids;
  for (int i = 0; i < 20; ++i) {
    setKids.insert(_js.getCurrentSigningCredentials().sKid);
  }
  EXPECT_EQ(setKids.size(), 1u);
}

TEST_F(JwksServiceTest, ConcurrentCallersShareOneRotation) {
  std::mutex mtx;
  std::set<std::string> setKids;
  std::vector<std::thread> vThreads;
  for (int i = 0; i < 8; ++i) {
    vThreads.emplace_back([&]() {
      const std::string sKid = _js.getCurrentSigningCredentials().sKid;
      std::lock_guard<std::mutex> lock(mtx);
      setKids.insert(sKid);
    });
  }
  for (auto& t : vThreads) t.join();

  EXPECT_EQ(setKids.size(), 1u);
  EXPECT_EQ(_store.getLastKeys(100, KeyType::Jws).size(), 1u);
}

TEST_F(JwksServiceTest, GeneratesFiveSigningAndEncryptingKeys) {
  for (int i = 0; i < 5; ++i) {
    _js.generateSigningCredentials();
    _js.generateEncryptingCredentials();
  }
  EXPECT_EQ(_js.getLastKeysCredentials(KeyType::Jws, 5).size(), 5u);
  EXPECT_EQ(_js.getLastKeysCredentials(KeyType::Jwe, 5).size(), 5u);
  EXPECT_EQ(_js.getLastKeysCredentials(KeyType::Jws, 50).size(), 5u);
}

TEST_F(JwksServiceTest, GeneratesRsaWithOptions) {
  JwksOptions jo;
  jo.jwsAlgorithm = JwsAlgorithm::RS512;
  const auto sc = _js.generateSigningCredentials(jo);
  EXPECT_EQ(sc.sAlgorithm, "RS512");
  EXPECT_EQ(sc.jwkKey.keyType(), "RSA");
}

TEST_F(JwksServiceTest, GeneratesEcdsaAndStoresIt) {
  JwksOptions jo;
  jo.jwsAlgorithm = JwsAlgorithm::ES384;
  const auto sc = _js.getCurrentSigningCredentials(jo);
  auto oStored = _store.getCurrent(KeyType::Jws);
  ASSERT_TRUE(oStored.has_value());
  EXPECT_EQ(oStored->sKeyId, sc.sKid);
  EXPECT_EQ(oStored->sAlgorithm, "ES384");
  EXPECT_EQ(oStored->jParameters["crv"], "P-384");
}

TEST_F(JwksServiceTest, DefaultEncryptingCredentials) {
  const auto ec = _js.getCurrentEncryptingCredentials();
  EXPECT_EQ(ec.sAlg, "RSA-OAEP");
  EXPECT_EQ(ec.sEnc, "A128CBC-HS256");
  EXPECT_EQ(ec.jwkKey.use(), "enc");
  EXPECT_EQ(_js.getCurrentEncryptingCredentials().jwkKey.keyId(), ec.jwkKey.keyId());
}

TEST_F(JwksServiceTest, IssuedEncryptedTokenValidates) {
  TokenDescriptor td;
  td.sIssuer = "me";
  td.sAudience = "you";
  for (int i = 0; i < 5; ++i) {
    td.jClaims["claim" + std::to_string(i)] = jwks::security::JwkService::newKeyId("v");
  }
  td.oSigningCredentials = _js.getCurrentSigningCredentials();
  td.oEncryptingCredentials = _js.getCurrentEncryptingCredentials();
  const std::string sToken = JwtHandler::createToken(td);

  TokenValidationParameters tvp;
  tvp.sValidIssuer = "me";
  tvp.sValidAudience = "you";
  tvp.bRequireSignedTokens = false;
  tvp.vIssuerSigningKeys = _js.getLastKeysCredentials(KeyType::Jws, 1);
  tvp.oTokenDecryptionKey = _js.getCurrentEncryptingCredentials().jwkKey;

  const auto tvr = JwtHandler::validateToken(sToken, tvp);
  ASSERT_TRUE(tvr.bIsValid) << tvr.sErrorCode << " " << tvr.sMessage;
  EXPECT_TRUE(tvr.bWasEncrypted);
  EXPECT_EQ(tvr.jClaims["claim3"], td.jClaims["claim3"]);
}

TEST_F(JwksServiceTest, EncryptedUnsignedTokenValidates) {
  TokenDescriptor td;
  td.sIssuer = "me";
  td.sAudience = "you";
  for (int i = 0; i < 5; ++i) {
    td.jClaims["claim" + std::to_string(i)] = jwks::security::JwkService::newKeyId("v");
  }
  td.oEncryptingCredentials = _js.getCurrentEncryptingCredentials();
  const std::string sToken = JwtHandler::createToken(td);

  TokenValidationParameters tvp;
  tvp.sValidIssuer = "me";
  tvp.sValidAudience = "you";
  tvp.bRequireSignedTokens = false;
  tvp.oTokenDecryptionKey = _js.getCurrentEncryptingCredentials().jwkKey;

  const auto tvr = JwtHandler::validateToken(sToken, tvp);
  ASSERT_TRUE(tvr.bIsValid) << tvr.sErrorCode << " " << tvr.sMessage;
  EXPECT_TRUE(tvr.bWasEncrypted);
  for (int i = 0; i < 5; ++i) {
    const std::string sName = "claim" + std::to_string(i);
    EXPECT_EQ(tvr.jClaims[sName], td.jClaims[sName]);
  }
}

TEST_F(JwksServiceTest, EveryJwsAlgorithmSignsVerifiableTokens) {
  for (const char* pAlg : {"HS256", "RS256", "PS256", "ES512"}) {
    JwksOptions jo;
    jo.jwsAlgorithm = Algorithm::jws(pAlg);
    _js.setOptions(jo);

    TokenDescriptor td;
    td.oSigningCredentials = _js.generateSigningCredentials();
    TokenValidationParameters tvp;
    tvp.vIssuerSigningKeys = _js.getLastKeysCredentials(KeyType::Jws, 1);

    const auto tvr = JwtHandler::validateToken(JwtHandler::createToken(td), tvp);
    EXPECT_TRUE(tvr.bIsValid) << pAlg << ": " << tvr.sErrorCode;
  }
}

TEST_F(JwksServiceTest, RevokedKeyIsRotated) {
  const auto scOld = _js.getCurrentSigningCredentials();
  _js.revokeKey(scOld.sKid, "compromised");

  const auto scNew = _js.getCurrentSigningCredentials();
  EXPECT_NE(scNew.sKid, scOld.sKid);

  auto vKeys = _js.getLastKeysCredentials(KeyType::Jws, 10);
  ASSERT_EQ(vKeys.size(), 1u);
  EXPECT_EQ(vKeys[0].keyId(), scNew.sKid);
}

TEST_F(JwksServiceTest, RevokeUnknownKeyIsNotFound) {
  EXPECT_THROW(_js.revokeKey("no-such-kid", "x"), jwks::common::NotFoundError);
}

TEST_F(JwksServiceTest, ExpiredKeyIsRotated) {
  auto km = KeyMaterial::create(KeyType::Jws, _jks.generate(JwsAlgorithm::ES256, "old_"));
  km.tpCreatedAt -= std::chrono::days(91);
  _store.store(km);

  const auto sc = _js.getCurrentSigningCredentials();
  EXPECT_NE(sc.sKid, km.sKeyId);

  JwksOptions jo;
  jo.iDaysUntilExpire = 365;
  _js.setOptions(jo);
  EXPECT_EQ(_js.getCurrentSigningCredentials().sKid, sc.sKid);
}

TEST_F(JwksServiceTest, LastKeysRejectsNonPositiveQuantity) {
  EXPECT_THROW(_js.getLastKeysCredentials(KeyType::Jws, 0), jwks::common::ValidationError);
  EXPECT_THROW(_js.getLastKeysCredentials(KeyType::Jwe, -3), jwks::common::ValidationError);
}

TEST_F(JwksServiceTest, LastKeysReturnsPublicKeysNewestFirst) {
  const auto sc1 = _js.generateSigningCredentials();
  const auto sc2 = _js.generateSigningCredentials();
  auto vKeys = _js.getLastKeysCredentials(KeyType::Jws, 2);
  ASSERT_EQ(vKeys.size(), 2u);
  EXPECT_EQ(vKeys[0].keyId(), sc2.sKid);
  EXPECT_EQ(vKeys[1].keyId(), sc1.sKid);
  EXPECT_FALSE(vKeys[0].hasPrivateKey());
}

TEST_F(JwksServiceTest, PublicKeySetHasNoPrivateMembers) {
  _js.getCurrentSigningCredentials();
  _js.getCurrentEncryptingCredentials();

  const auto jSet = _js.getPublicKeySet();
  ASSERT_TRUE(jSet.contains("keys"));
  ASSERT_EQ(jSet["keys"].size(), 2u);
  for (const auto& jKey : jSet["keys"]) {
    for (const char* pPrivate : {"d", "p", "q", "dp", "dq", "qi", "k"}) {
      EXPECT_FALSE(jKey.contains(pPrivate)) << pPrivate;
    }
  }
}

TEST_F(JwksServiceTest, PublicKeySetKeepsNewestPerType) {
  for (int i = 0; i < 4; ++i) _js.generateSigningCredentials();
  const auto scRevoked = _js.generateSigningCredentials();
  _js.revokeKey(scRevoked.sKid, "test");
  _js.generateEncryptingCredentials();

  const auto jSet = _js.getPublicKeySet();
  ASSERT_EQ(jSet["keys"].size(), 3u);
  for (const auto& jKey : jSet["keys"]) {
    EXPECT_NE(jKey["kid"], scRevoked.sKid);
  }

  JwksOptions jo;
  jo.iAlgorithmsToKeep = 4;
  EXPECT_EQ(_js.getPublicKeySet(jo)["keys"].size(), 5u);
}

TEST_F(JwksServiceTest, PublicKeySetSkipsSymmetricKeys) {
  JwksOptions jo;
  jo.jwsAlgorithm = JwsAlgorithm::HS256;
  _js.generateSigningCredentials(jo);
  EXPECT_TRUE(_js.getPublicKeySet()["keys"].empty());
  EXPECT_EQ(_js.getLastKeysCredentials(KeyType::Jws, 1)[0].keyType(), "oct");
}

TEST_F(JwksServiceTest, RejectsInvalidOptions) {
  JwksOptions jo;
  jo.jwsAlgorithm = JweAlgorithm::RsaOaep256Aes256Gcm;
  EXPECT_THROW(_js.setOptions(jo), jwks::common::ValidationError);

  JwksOptions joBad;
  joBad.iAlgorithmsToKeep = 0;
  EXPECT_THROW({ JwksService js(_store, _jks, joBad); }, jwks::common::ValidationError);
}
