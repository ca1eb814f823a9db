#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/JwksOptions.hpp"
#include "security/Credentials.hpp"
#include "security/JwkService.hpp"
#include "store/IJsonWebKeyStore.hpp"

namespace jwks::core {

/// Hands out current signing/encrypting credentials, rotating keys that are
/// missing, expired or revoked, and builds the public key set.
/// Every operation has an overload taking explicit options; the others use
/// the service-wide options.
/// Class abbreviation: js
class JwksService {
 public:
  JwksService(store::IJsonWebKeyStore& store, const security::JwkService& jwkService,
              JwksOptions options = {});
  ~JwksService();

  void setOptions(JwksOptions options);
  JwksOptions options() const;

  // ── Signing (JWS) ─────────────────────────────────────────────────────
  security::SigningCredentials generateSigningCredentials();
  security::SigningCredentials generateSigningCredentials(const JwksOptions& jo);
  security::SigningCredentials getCurrentSigningCredentials();
  security::SigningCredentials getCurrentSigningCredentials(const JwksOptions& jo);

  // ── Encrypting (JWE) ──────────────────────────────────────────────────
  security::EncryptingCredentials generateEncryptingCredentials();
  security::EncryptingCredentials generateEncryptingCredentials(const JwksOptions& jo);
  security::EncryptingCredentials getCurrentEncryptingCredentials();
  security::EncryptingCredentials getCurrentEncryptingCredentials(const JwksOptions& jo);

  /// Newest iQuantity non-revoked keys of eType as validation keys: the
  /// public JWK for RSA/EC, the oct key itself for HS.
  /// Throws ValidationError when iQuantity < 1.
  std::vector<security::JsonWebKey> getLastKeysCredentials(common::KeyType eType, int iQuantity);

  /// Throws NotFoundError for an unknown kid.
  void revokeKey(const std::string& sKeyId, const std::string& sReason);

  /// {"keys": [...]} with the newest iAlgorithmsToKeep non-revoked keys of
  /// each type. Symmetric keys are never included.
  nlohmann::json getPublicKeySet();
  nlohmann::json getPublicKeySet(const JwksOptions& jo);

 private:
  security::KeyMaterial generate(common::KeyType eType, const JwksOptions& jo);
  security::KeyMaterial current(common::KeyType eType, const JwksOptions& jo);
  std::vector<security::KeyMaterial> lastActive(common::KeyType eType, int iQuantity);

  static security::SigningCredentials toSigning(const security::KeyMaterial& km);
  static security::EncryptingCredentials toEncrypting(const security::KeyMaterial& km);

  store::IJsonWebKeyStore& _store;
  const security::JwkService& _jwkService;
  JwksOptions _options;
  mutable std::mutex _mtxOptions;
  std::mutex _mtxRotation;
};

}  // namespace jwks::core
