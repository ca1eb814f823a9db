#include "store/InMemoryStore.hpp"

#include "common/Errors.hpp"
#include "security/Algorithm.hpp"
#include "security/JwkService.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using jwks::common::KeyType;
using jwks::security::Algorithm;
using jwks::security::JwkService;
using jwks::security::KeyMaterial;
using jwks::store::InMemoryStore;

namespace {

KeyMaterial makeKey(KeyType eType) {
  JwkService jks;
  return KeyMaterial::create(eType, jks.generate(Algorithm::jws("HS256"), "mem_"),
                             eType == KeyType::Jwe ? "A128GCM" : "");
}

}  // namespace

TEST(InMemoryStoreTest, EmptyStoreHasNoCurrentKey) {
  InMemoryStore ims;
  EXPECT_FALSE(ims.getCurrent(KeyType::Jws).has_value());
  EXPECT_TRUE(ims.getLastKeys(5, std::nullopt).empty());
  EXPECT_FALSE(ims.get("missing").has_value());
}

TEST(InMemoryStoreTest, CurrentIsNewestOfType) {
  InMemoryStore ims;
  auto kmOld = makeKey(KeyType::Jws);
  kmOld.tpCreatedAt -= std::chrono::hours(1);
  auto kmNew = makeKey(KeyType::Jws);
  auto kmEnc = makeKey(KeyType::Jwe);

  ims.store(kmNew);
  ims.store(kmOld);
  ims.store(kmEnc);

  EXPECT_EQ(ims.getCurrent(KeyType::Jws)->sKeyId, kmNew.sKeyId);
  EXPECT_EQ(ims.getCurrent(KeyType::Jwe)->sKeyId, kmEnc.sKeyId);
}

TEST(InMemoryStoreTest, SameInstantOrderedByInsertion) {
  InMemoryStore ims;
  auto km1 = makeKey(KeyType::Jws);
  auto km2 = makeKey(KeyType::Jws);
  km2.tpCreatedAt = km1.tpCreatedAt;
  ims.store(km1);
  ims.store(km2);

  auto vKeys = ims.getLastKeys(2, KeyType::Jws);
  ASSERT_EQ(vKeys.size(), 2u);
  EXPECT_EQ(vKeys[0].sKeyId, km2.sKeyId);
  EXPECT_EQ(vKeys[1].sKeyId, km1.sKeyId);
}

TEST(InMemoryStoreTest, LastKeysLimitsAndFiltersByType) {
  InMemoryStore ims;
  for (int i = 0; i < 4; ++i) ims.store(makeKey(KeyType::Jws));
  for (int i = 0; i < 3; ++i) ims.store(makeKey(KeyType::Jwe));

  EXPECT_EQ(ims.getLastKeys(10, KeyType::Jws).size(), 4u);
  EXPECT_EQ(ims.getLastKeys(2, KeyType::Jwe).size(), 2u);
  EXPECT_EQ(ims.getLastKeys(10, std::nullopt).size(), 7u);
  EXPECT_TRUE(ims.getLastKeys(0, std::nullopt).empty());
}

TEST(InMemoryStoreTest, DuplicateKidConflicts) {
  InMemoryStore ims;
  const auto km = makeKey(KeyType::Jws);
  ims.store(km);
  EXPECT_THROW(ims.store(km), jwks::common::ConflictError);
}

TEST(InMemoryStoreTest, RevokeMarksKeyAndKeepsIt) {
  InMemoryStore ims;
  const auto km = makeKey(KeyType::Jws);
  ims.store(km);
  ims.revoke(km.sKeyId, "compromised");

  auto oKey = ims.get(km.sKeyId);
  ASSERT_TRUE(oKey.has_value());
  EXPECT_TRUE(oKey->bRevoked);
  EXPECT_EQ(oKey->sRevokedReason, "compromised");
  EXPECT_TRUE(oKey->oExpiredAt.has_value());
  // getCurrent ignores revocation
  EXPECT_EQ(ims.getCurrent(KeyType::Jws)->sKeyId, km.sKeyId);
}

TEST(InMemoryStoreTest, RevokeUnknownKidIsNotFound) {
  InMemoryStore ims;
  EXPECT_THROW(ims.revoke("nope", "x"), jwks::common::NotFoundError);
}

TEST(InMemoryStoreTest, ClearRemovesEverything) {
  InMemoryStore ims;
  ims.store(makeKey(KeyType::Jws));
  ims.store(makeKey(KeyType::Jwe));
  ims.clear();
  EXPECT_TRUE(ims.getLastKeys(10, std::nullopt).empty());
}
