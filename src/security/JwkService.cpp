#include "security/JwkService.hpp"

#include "security/Base64Url.hpp"
#include "security/CryptoService.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace jwks::security {

namespace {
constexpr size_t kKeyIdRandomBytes = 16;
}  // namespace

JwkService::JwkService() = default;
JwkService::~JwkService() = default;

std::string JwkService::newKeyId(const std::string& sKeyPrefix) {
  return sKeyPrefix + base64url::encode(CryptoService::randomBytes(kKeyIdRandomBytes));
}

EvpPkeyPtr JwkService::generateRsa(int iBits) {
  EVP_PKEY* pKey = EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(iBits));
  if (!pKey) {
    throw std::runtime_error("RSA key generation failed (" + std::to_string(iBits) + " bits)");
  }
  return makeEvpPkeyPtr(pKey);
}

EvpPkeyPtr JwkService::generateEc(const std::string& sCurve) {
  EVP_PKEY* pKey = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", sCurve.c_str());
  if (!pKey) {
    throw std::runtime_error("EC key generation failed on curve " + sCurve);
  }
  return makeEvpPkeyPtr(pKey);
}

JsonWebKey JwkService::generate(const Algorithm& alg, const std::string& sKeyPrefix) const {
  const std::string sKid = newKeyId(sKeyPrefix);
  const std::string sUse = alg.keyType() == common::KeyType::Jws ? "sig" : "enc";

  switch (alg.family()) {
    case KeyFamily::Rsa:
    case KeyFamily::RsaPss: {
      auto pKey = generateRsa(alg.keySizeBits());
      return JsonWebKey::fromEvpPkey(pKey.get(), sKid, alg.name(), sUse);
    }
    case KeyFamily::Ecdsa: {
      auto pKey = generateEc(alg.curve());
      return JsonWebKey::fromEvpPkey(pKey.get(), sKid, alg.name(), sUse);
    }
    case KeyFamily::Hmac: {
      auto vSecret = CryptoService::randomBytes(static_cast<size_t>(alg.keySizeBits() / 8));
      auto jwk = JsonWebKey::fromSymmetricKey(vSecret, sKid, alg.name(), sUse);
      OPENSSL_cleanse(vSecret.data(), vSecret.size());
      return jwk;
    }
  }
  throw std::logic_error("Unhandled key family for " + alg.name());
}

}  // namespace jwks::security
