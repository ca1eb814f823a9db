#pragma once

#include <string>

#include "security/JsonWebKey.hpp"

namespace jwks::security {

/// Private key and JWS algorithm used to sign tokens.
/// Class abbreviation: sc
struct SigningCredentials {
  std::string sKid;
  std::string sAlgorithm;
  JsonWebKey jwkKey;
};

/// Key and JWE algorithm pair used to encrypt tokens. jwkKey holds the
/// private half so the same credentials can decrypt.
/// Class abbreviation: ec
struct EncryptingCredentials {
  JsonWebKey jwkKey;
  std::string sAlg;
  std::string sEnc;
};

}  // namespace jwks::security
