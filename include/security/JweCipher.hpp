#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "security/Credentials.hpp"
#include "security/JsonWebKey.hpp"

namespace jwks::security {

/// Result of opening a JWE: protected header and plaintext.
struct JweContent {
  nlohmann::json jHeader;
  std::string sPlaintext;
};

/// JWE compact serialization (RFC 7516) with RSA-OAEP / RSA-OAEP-256 key
/// wrapping and AES-GCM or AES-CBC-HMAC-SHA2 content encryption (RFC 7518 §5).
/// Class abbreviation: jc
class JweCipher {
 public:
  /// Encrypt sPlaintext to the public half of ecCreds.jwkKey.
  /// jExtraHeader members (e.g. "typ", "cty") are merged into the protected header.
  static std::string encrypt(const std::string& sPlaintext,
                             const EncryptingCredentials& ecCreds,
                             const nlohmann::json& jExtraHeader = nlohmann::json::object());

  /// Decrypt with the private RSA key in jwkKey.
  /// Throws ValidationError on malformed tokens and AuthenticationError
  /// ("decryption_failed") when the key does not match or the tag fails.
  static JweContent decrypt(const std::string& sToken, const JsonWebKey& jwkKey);

  /// True for a five-part compact serialization.
  static bool isJwe(const std::string& sToken);

  /// Decode the protected header without decrypting.
  static nlohmann::json readHeader(const std::string& sToken);

 private:
  static std::vector<std::string> split(const std::string& sToken);
};

}  // namespace jwks::security
