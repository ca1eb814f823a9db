#include "core/JwksService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <initializer_list>
#include <utility>

namespace jwks::core {

JwksService::JwksService(store::IJsonWebKeyStore& store, const security::JwkService& jwkService,
                         JwksOptions options)
    : _store(store), _jwkService(jwkService), _options(std::move(options)) {
  _options.validate();
}

JwksService::~JwksService() = default;

void JwksService::setOptions(JwksOptions options) {
  options.validate();
  std::lock_guard<std::mutex> lock(_mtxOptions);
  _options = std::move(options);
}

JwksOptions JwksService::options() const {
  std::lock_guard<std::mutex> lock(_mtxOptions);
  return _options;
}

// ── Key lifecycle ──────────────────────────────────────────────────────────

security::KeyMaterial JwksService::generate(common::KeyType eType, const JwksOptions& jo) {
  jo.validate();
  const auto& alg = eType == common::KeyType::Jws ? jo.jwsAlgorithm : jo.jweAlgorithm;
  const auto jwk = _jwkService.generate(alg, jo.sKeyPrefix);
  auto km = security::KeyMaterial::create(eType, jwk, alg.encryption());
  _store.store(km);

  common::Logger::get()->info("Generated {} key {} ({}{}{})", common::toString(eType),
                              km.sKeyId, km.sAlgorithm, km.sEncryption.empty() ? "" : " ",
                              km.sEncryption);
  return km;
}

security::KeyMaterial JwksService::current(common::KeyType eType, const JwksOptions& jo) {
  std::lock_guard<std::mutex> lock(_mtxRotation);
  auto oCurrent = _store.getCurrent(eType);
  if (oCurrent && !oCurrent->bRevoked && !oCurrent->isExpired(jo.iDaysUntilExpire)) {
    return std::move(*oCurrent);
  }

  auto spLog = common::Logger::get();
  if (!oCurrent) {
    spLog->info("No {} key stored; generating one", common::toString(eType));
  } else if (oCurrent->bRevoked) {
    spLog->info("Current {} key {} is revoked; rotating", common::toString(eType),
                oCurrent->sKeyId);
  } else {
    spLog->info("Current {} key {} expired; rotating", common::toString(eType),
                oCurrent->sKeyId);
  }
  return generate(eType, jo);
}

std::vector<security::KeyMaterial> JwksService::lastActive(common::KeyType eType,
                                                           int iQuantity) {
  const size_t nWanted = static_cast<size_t>(iQuantity);
  int iFetch = iQuantity;
  while (true) {
    auto vKeys = _store.getLastKeys(iFetch, eType);
    const bool bExhausted = vKeys.size() < static_cast<size_t>(iFetch);

    std::vector<security::KeyMaterial> vActive;
    for (auto& km : vKeys) {
      if (km.bRevoked) continue;
      vActive.push_back(std::move(km));
      if (vActive.size() == nWanted) break;
    }
    if (vActive.size() == nWanted || bExhausted) {
      return vActive;
    }
    iFetch *= 2;
  }
}

security::SigningCredentials JwksService::toSigning(const security::KeyMaterial& km) {
  return security::SigningCredentials{km.sKeyId, km.sAlgorithm, km.jsonWebKey()};
}

security::EncryptingCredentials JwksService::toEncrypting(const security::KeyMaterial& km) {
  return security::EncryptingCredentials{km.jsonWebKey(), km.sAlgorithm, km.sEncryption};
}

// ── Signing ────────────────────────────────────────────────────────────────

security::SigningCredentials JwksService::generateSigningCredentials() {
  return generateSigningCredentials(options());
}

security::SigningCredentials JwksService::generateSigningCredentials(const JwksOptions& jo) {
  return toSigning(generate(common::KeyType::Jws, jo));
}

security::SigningCredentials JwksService::getCurrentSigningCredentials() {
  return getCurrentSigningCredentials(options());
}

security::SigningCredentials JwksService::getCurrentSigningCredentials(const JwksOptions& jo) {
  return toSigning(current(common::KeyType::Jws, jo));
}

// ── Encrypting ─────────────────────────────────────────────────────────────

security::EncryptingCredentials JwksService::generateEncryptingCredentials() {
  return generateEncryptingCredentials(options());
}

security::EncryptingCredentials JwksService::generateEncryptingCredentials(
    const JwksOptions& jo) {
  return toEncrypting(generate(common::KeyType::Jwe, jo));
}

security::EncryptingCredentials JwksService::getCurrentEncryptingCredentials() {
  return getCurrentEncryptingCredentials(options());
}

security::EncryptingCredentials JwksService::getCurrentEncryptingCredentials(
    const JwksOptions& jo) {
  return toEncrypting(current(common::KeyType::Jwe, jo));
}

// ── Listing ────────────────────────────────────────────────────────────────

std::vector<security::JsonWebKey> JwksService::getLastKeysCredentials(common::KeyType eType,
                                                                      int iQuantity) {
  if (iQuantity < 1) {
    throw common::ValidationError("invalid_quantity", "Quantity must be at least 1");
  }

  std::vector<security::JsonWebKey> vKeys;
  for (const auto& km : lastActive(eType, iQuantity)) {
    auto jwk = km.jsonWebKey();
    vKeys.push_back(jwk.isSymmetric() ? jwk : jwk.toPublic());
  }
  return vKeys;
}

void JwksService::revokeKey(const std::string& sKeyId, const std::string& sReason) {
  std::lock_guard<std::mutex> lock(_mtxRotation);
  _store.revoke(sKeyId, sReason);
  common::Logger::get()->warn("Revoked key {}: {}", sKeyId,
                              sReason.empty() ? "(no reason)" : sReason);
}

nlohmann::json JwksService::getPublicKeySet() { return getPublicKeySet(options()); }

nlohmann::json JwksService::getPublicKeySet(const JwksOptions& jo) {
  nlohmann::json jKeys = nlohmann::json::array();
  for (const auto eType : {common::KeyType::Jws, common::KeyType::Jwe}) {
    for (const auto& km : lastActive(eType, jo.iAlgorithmsToKeep)) {
      auto jwk = km.jsonWebKey();
      if (jwk.isSymmetric()) continue;
      jKeys.push_back(jwk.toPublic().json());
    }
  }
  return nlohmann::json{{"keys", jKeys}};
}

}  // namespace jwks::core
