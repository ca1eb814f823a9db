#pragma once

#include <string>

#include "security/Algorithm.hpp"
#include "security/JsonWebKey.hpp"

namespace jwks::security {

/// Generates fresh private JWKs for a JOSE algorithm.
/// Class abbreviation: jks
class JwkService {
 public:
  JwkService();
  ~JwkService();

  /// RSA 2048 for RS/PS/RSA-OAEP, EC on the algorithm curve for ES,
  /// a random oct secret of the digest length for HS.
  /// The key id is sKeyPrefix followed by 16 random bytes in base64url.
  JsonWebKey generate(const Algorithm& alg, const std::string& sKeyPrefix) const;

  /// sKeyPrefix + base64url(16 random bytes).
  static std::string newKeyId(const std::string& sKeyPrefix);

 private:
  static EvpPkeyPtr generateRsa(int iBits);
  static EvpPkeyPtr generateEc(const std::string& sCurve);
};

}  // namespace jwks::security
