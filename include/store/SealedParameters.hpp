#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "security/CryptoService.hpp"
#include "security/KeyMaterial.hpp"

namespace jwks::store {

/// Private JWK parameters as persisted: plain JSON text, or AES-256-GCM
/// ciphertext bound to the kid when a CryptoService is configured.
/// Class abbreviation: sp
struct SealedParameters {
  std::string sText;
  bool bEncrypted = false;

  static SealedParameters seal(const security::KeyMaterial& km,
                               const security::CryptoService* pCrypto);

  /// Throws KeyStoreError when the text is encrypted and pCrypto is null,
  /// or when it does not decrypt/parse.
  nlohmann::json open(const std::string& sKeyId, const security::CryptoService* pCrypto) const;
};

}  // namespace jwks::store
