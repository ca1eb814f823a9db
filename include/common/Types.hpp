#pragma once

#include <string>

namespace jwks::common {

/// Purpose of a stored key: signing (JWS) or encrypting (JWE).
enum class KeyType { Jws, Jwe };

/// "jws" / "jwe".
std::string toString(KeyType eType);

/// Parse "jws" / "jwe" (case-insensitive). Throws ValidationError otherwise.
KeyType keyTypeFromString(const std::string& sValue);

}  // namespace jwks::common
