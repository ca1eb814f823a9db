#include "store/SealedParameters.hpp"

#include "common/Errors.hpp"

namespace jwks::store {

SealedParameters SealedParameters::seal(const security::KeyMaterial& km,
                                        const security::CryptoService* pCrypto) {
  SealedParameters sp;
  const std::string sPlain = km.jParameters.dump();
  if (pCrypto == nullptr) {
    sp.sText = sPlain;
    return sp;
  }
  sp.sText = pCrypto->encrypt(sPlain, km.sKeyId);
  sp.bEncrypted = true;
  return sp;
}

nlohmann::json SealedParameters::open(const std::string& sKeyId,
                                      const security::CryptoService* pCrypto) const {
  std::string sPlain = sText;
  if (bEncrypted) {
    if (pCrypto == nullptr) {
      throw common::KeyStoreError("master_key_required",
                                  "Key '" + sKeyId + "' is encrypted; set JWKS_MASTER_KEY");
    }
    try {
      sPlain = pCrypto->decrypt(sText, sKeyId);
    } catch (const common::AppError& e) {
      throw common::KeyStoreError("key_unreadable",
                                  "Cannot decrypt key '" + sKeyId + "': " + e.what());
    }
  }

  try {
    return nlohmann::json::parse(sPlain);
  } catch (const nlohmann::json::parse_error& e) {
    throw common::KeyStoreError("key_unreadable",
                                "Stored parameters of '" + sKeyId + "' are not JSON: " + e.what());
  }
}

}  // namespace jwks::store
