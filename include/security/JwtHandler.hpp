#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "security/Credentials.hpp"
#include "security/JsonWebKey.hpp"

namespace jwks::security {

/// What goes into a new token.
/// Class abbreviation: td
struct TokenDescriptor {
  std::string sIssuer;
  std::string sAudience;
  std::optional<std::chrono::system_clock::time_point> oIssuedAt;
  std::optional<std::chrono::system_clock::time_point> oNotBefore;
  std::optional<std::chrono::system_clock::time_point> oExpires;
  nlohmann::json jClaims = nlohmann::json::object();
  std::optional<SigningCredentials> oSigningCredentials;
  std::optional<EncryptingCredentials> oEncryptingCredentials;
};

/// Class abbreviation: tvp
struct TokenValidationParameters {
  std::string sValidIssuer;    // empty = not checked
  std::string sValidAudience;  // empty = not checked
  bool bRequireSignedTokens = true;
  std::vector<JsonWebKey> vIssuerSigningKeys;
  std::optional<JsonWebKey> oTokenDecryptionKey;
  bool bValidateLifetime = true;
  std::chrono::seconds durClockSkew = std::chrono::minutes(5);
};

/// Class abbreviation: tvr
struct TokenValidationResult {
  bool bIsValid = false;
  std::string sErrorCode;
  std::string sMessage;
  nlohmann::json jClaims = nlohmann::json::object();
  std::string sKeyId;
  bool bWasEncrypted = false;
};

/// Issues and validates JWTs. Signing and verification go through jwt-cpp;
/// encrypted tokens are wrapped with JweCipher.
/// Class abbreviation: jh
class JwtHandler {
 public:
  /// Build a JWS (or an unsecured JWT when no signing credentials are given),
  /// then wrap it in a JWE when encrypting credentials are present.
  /// Throws ValidationError / UnsupportedAlgorithmError on unusable credentials.
  static std::string createToken(const TokenDescriptor& td);

  /// Never throws for a bad token; failures come back with bIsValid = false.
  static TokenValidationResult validateToken(const std::string& sToken,
                                             const TokenValidationParameters& tvp);

 private:
  static TokenValidationResult fail(std::string sErrorCode, std::string sMessage);
};

}  // namespace jwks::security
