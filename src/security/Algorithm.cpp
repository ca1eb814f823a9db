#include "security/Algorithm.hpp"

#include "common/Errors.hpp"

#include <utility>

namespace jwks::security {

namespace {
constexpr int kRsaKeyBits = 2048;
}  // namespace

Algorithm::Algorithm(std::string sName, std::string sEnc, common::KeyType eType,
                     KeyFamily eFamily, std::string sCurve, int iKeySizeBits)
    : _sName(std::move(sName)),
      _sEnc(std::move(sEnc)),
      _eType(eType),
      _eFamily(eFamily),
      _sCurve(std::move(sCurve)),
      _iKeySizeBits(iKeySizeBits) {}

Algorithm Algorithm::jws(const std::string& sName) {
  using common::KeyType;

  if (sName.size() == 5) {
    const std::string sPrefix = sName.substr(0, 2);
    const std::string sBits = sName.substr(2);
    if (sBits == "256" || sBits == "384" || sBits == "512") {
      const int iBits = std::stoi(sBits);
      if (sPrefix == "HS") {
        return Algorithm(sName, "", KeyType::Jws, KeyFamily::Hmac, "", iBits);
      }
      if (sPrefix == "RS") {
        return Algorithm(sName, "", KeyType::Jws, KeyFamily::Rsa, "", kRsaKeyBits);
      }
      if (sPrefix == "PS") {
        return Algorithm(sName, "", KeyType::Jws, KeyFamily::RsaPss, "", kRsaKeyBits);
      }
      if (sPrefix == "ES") {
        // ES512 uses P-521, not P-512
        if (iBits == 512) {
          return Algorithm(sName, "", KeyType::Jws, KeyFamily::Ecdsa, "P-521", 521);
        }
        return Algorithm(sName, "", KeyType::Jws, KeyFamily::Ecdsa,
                         "P-" + sBits, iBits);
      }
    }
  }

  throw common::UnsupportedAlgorithmError("unsupported_algorithm",
                                          "Unsupported JWS algorithm: " + sName);
}

Algorithm Algorithm::jwe(const std::string& sAlg, const std::string& sEnc) {
  if (sAlg != "RSA-OAEP" && sAlg != "RSA-OAEP-256") {
    throw common::UnsupportedAlgorithmError("unsupported_algorithm",
                                            "Unsupported JWE key management algorithm: " + sAlg);
  }
  if (sEnc != "A128CBC-HS256" && sEnc != "A192CBC-HS384" && sEnc != "A256CBC-HS512" &&
      sEnc != "A128GCM" && sEnc != "A192GCM" && sEnc != "A256GCM") {
    throw common::UnsupportedAlgorithmError("unsupported_encryption",
                                            "Unsupported JWE content encryption: " + sEnc);
  }
  return Algorithm(sAlg, sEnc, common::KeyType::Jwe, KeyFamily::Rsa, "", kRsaKeyBits);
}

}  // namespace jwks::security
