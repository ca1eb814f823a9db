#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "security/OpenSslTypes.hpp"

namespace jwks::security {

/// A JSON Web Key (RFC 7517) backed by its JSON object.
/// Supports kty RSA, EC (P-256/P-384/P-521) and oct.
/// Class abbreviation: jwk
class JsonWebKey {
 public:
  JsonWebKey() = default;

  /// Validate and wrap a JWK object. Throws ValidationError when required
  /// members for its kty are missing or not strings.
  static JsonWebKey fromJson(const nlohmann::json& jKey);

  /// Export an OpenSSL RSA or EC key. Private members are included when
  /// pKey holds a private key.
  static JsonWebKey fromEvpPkey(const EVP_PKEY* pKey, const std::string& sKeyId,
                                const std::string& sAlgorithm, const std::string& sUse);

  /// Wrap a raw secret as an oct key.
  static JsonWebKey fromSymmetricKey(const std::vector<unsigned char>& vSecret,
                                     const std::string& sKeyId,
                                     const std::string& sAlgorithm,
                                     const std::string& sUse);

  const nlohmann::json& json() const { return _jKey; }

  std::string keyId() const;
  std::string keyType() const;
  std::string algorithm() const;
  std::string use() const;
  bool hasPrivateKey() const;
  bool isSymmetric() const { return keyType() == "oct"; }

  /// Copy without private members. Throws ValidationError for oct keys.
  JsonWebKey toPublic() const;

  /// PKCS#8 PEM of the private key. Throws ValidationError when absent.
  std::string toPrivatePem() const;

  /// SubjectPublicKeyInfo PEM of the public key.
  std::string toPublicPem() const;

  /// Raw bytes of an oct key's "k".
  std::vector<unsigned char> symmetricKey() const;

  /// Build an OpenSSL key. bPrivate selects the key pair instead of the
  /// public half.
  EvpPkeyPtr toEvpPkey(bool bPrivate) const;

 private:
  explicit JsonWebKey(nlohmann::json jKey) : _jKey(std::move(jKey)) {}

  std::string member(const char* pName) const;

  nlohmann::json _jKey = nlohmann::json::object();
};

}  // namespace jwks::security
