#pragma once

#include <string>

#include "common/Types.hpp"

namespace jwks::security {

/// Key family an algorithm needs.
enum class KeyFamily { Rsa, RsaPss, Ecdsa, Hmac };

/// One JOSE algorithm: a JWS "alg", or a JWE "alg" + "enc" pair.
/// Class abbreviation: alg
class Algorithm {
 public:
  /// Parse a JWS name (HS/RS/PS/ES 256/384/512).
  /// Throws UnsupportedAlgorithmError on unknown names.
  static Algorithm jws(const std::string& sName);

  /// Parse a JWE key management alg (RSA-OAEP, RSA-OAEP-256) and content
  /// encryption (A128/192/256CBC-HS256/384/512, A128/192/256GCM).
  static Algorithm jwe(const std::string& sAlg, const std::string& sEnc);

  const std::string& name() const { return _sName; }
  const std::string& encryption() const { return _sEnc; }
  common::KeyType keyType() const { return _eType; }
  KeyFamily family() const { return _eFamily; }

  /// "P-256", "P-384", "P-521" for Ecdsa; empty otherwise.
  const std::string& curve() const { return _sCurve; }

  /// RSA modulus bits or HMAC secret bits. For EC, the field size.
  int keySizeBits() const { return _iKeySizeBits; }

  bool operator==(const Algorithm&) const = default;

 private:
  Algorithm(std::string sName, std::string sEnc, common::KeyType eType, KeyFamily eFamily,
            std::string sCurve, int iKeySizeBits);

  std::string _sName;
  std::string _sEnc;
  common::KeyType _eType;
  KeyFamily _eFamily;
  std::string _sCurve;
  int _iKeySizeBits;
};

namespace JwsAlgorithm {
inline const Algorithm HS256 = Algorithm::jws("HS256");
inline const Algorithm HS384 = Algorithm::jws("HS384");
inline const Algorithm HS512 = Algorithm::jws("HS512");
inline const Algorithm RS256 = Algorithm::jws("RS256");
inline const Algorithm RS384 = Algorithm::jws("RS384");
inline const Algorithm RS512 = Algorithm::jws("RS512");
inline const Algorithm PS256 = Algorithm::jws("PS256");
inline const Algorithm PS384 = Algorithm::jws("PS384");
inline const Algorithm PS512 = Algorithm::jws("PS512");
inline const Algorithm ES256 = Algorithm::jws("ES256");
inline const Algorithm ES384 = Algorithm::jws("ES384");
inline const Algorithm ES512 = Algorithm::jws("ES512");
}  // namespace JwsAlgorithm

namespace JweAlgorithm {
inline const Algorithm RsaOaepAes128CbcHmacSha256 = Algorithm::jwe("RSA-OAEP", "A128CBC-HS256");
inline const Algorithm RsaOaepAes256Gcm = Algorithm::jwe("RSA-OAEP", "A256GCM");
inline const Algorithm RsaOaep256Aes256Gcm = Algorithm::jwe("RSA-OAEP-256", "A256GCM");
}  // namespace JweAlgorithm

}  // namespace jwks::security
