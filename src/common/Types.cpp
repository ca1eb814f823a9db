#include "common/Types.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace jwks::common {

std::string toString(KeyType eType) {
  return eType == KeyType::Jws ? "jws" : "jwe";
}

KeyType keyTypeFromString(const std::string& sValue) {
  std::string sLower = sValue;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (sLower == "jws") return KeyType::Jws;
  if (sLower == "jwe") return KeyType::Jwe;
  throw ValidationError("invalid_key_type", "Unknown key type: " + sValue);
}

}  // namespace jwks::common
