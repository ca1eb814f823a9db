#include "security/JsonWebKey.hpp"

#include "common/Errors.hpp"
#include "security/Base64Url.hpp"

#include <openssl/core_names.h>
#include <openssl/pem.h>

#include <array>
#include <initializer_list>
#include <optional>
#include <stdexcept>

namespace jwks::security {

namespace {

// RSA private members in export order
constexpr std::array<const char*, 6> kRsaPrivateMembers = {"d", "p", "q", "dp", "dq", "qi"};

struct CurveInfo {
  const char* pJwkName;
  const char* pGroupName;
  size_t nCoordinateLen;
};

constexpr std::array<CurveInfo, 3> kCurves = {{
    {"P-256", "prime256v1", 32},
    {"P-384", "secp384r1", 48},
    {"P-521", "secp521r1", 66},
}};

const CurveInfo& curveByJwkName(const std::string& sCrv) {
  for (const auto& ci : kCurves) {
    if (sCrv == ci.pJwkName) return ci;
  }
  throw common::ValidationError("invalid_jwk", "Unsupported EC curve: " + sCrv);
}

const CurveInfo& curveByGroupName(const std::string& sGroup) {
  for (const auto& ci : kCurves) {
    if (sGroup == ci.pGroupName) return ci;
  }
  throw common::ValidationError("invalid_jwk", "Unsupported EC group: " + sGroup);
}

/// Read a BIGNUM parameter; nullopt when the key does not carry it.
std::optional<std::string> tryBnParam(const EVP_PKEY* pKey, const char* pName,
                                      size_t nPadTo = 0) {
  BIGNUM* pBn = nullptr;
  if (EVP_PKEY_get_bn_param(pKey, pName, &pBn) != 1 || pBn == nullptr) {
    return std::nullopt;
  }
  BignumPtr bn(pBn, &BN_clear_free);

  const size_t nLen = nPadTo > 0 ? nPadTo : static_cast<size_t>(BN_num_bytes(bn.get()));
  std::vector<unsigned char> vBytes(nLen);
  if (nPadTo > 0) {
    if (BN_bn2binpad(bn.get(), vBytes.data(), static_cast<int>(nLen)) < 0) {
      throw std::runtime_error(std::string("BN_bn2binpad failed for ") + pName);
    }
  } else {
    BN_bn2bin(bn.get(), vBytes.data());
  }
  std::string sEncoded = base64url::encode(vBytes);
  OPENSSL_cleanse(vBytes.data(), vBytes.size());
  return sEncoded;
}

std::string bnParam(const EVP_PKEY* pKey, const char* pName, size_t nPadTo = 0) {
  auto oValue = tryBnParam(pKey, pName, nPadTo);
  if (!oValue.has_value()) {
    throw std::runtime_error(std::string("Key is missing parameter ") + pName);
  }
  return *oValue;
}

BignumPtr decodeBignum(const nlohmann::json& jKey, const char* pMember) {
  auto vBytes = base64url::decodeBytes(jKey.at(pMember).get<std::string>());
  BIGNUM* pBn = BN_bin2bn(vBytes.data(), static_cast<int>(vBytes.size()), nullptr);
  OPENSSL_cleanse(vBytes.data(), vBytes.size());
  if (!pBn) {
    throw std::runtime_error(std::string("BN_bin2bn failed for JWK member ") + pMember);
  }
  return BignumPtr(pBn, &BN_clear_free);
}

EvpPkeyPtr fromData(const char* pKeyType, OSSL_PARAM_BLD* pBld, int iSelection) {
  ParamPtr params(OSSL_PARAM_BLD_to_param(pBld), &OSSL_PARAM_free);
  if (!params) {
    throw std::runtime_error("OSSL_PARAM_BLD_to_param failed");
  }

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, pKeyType, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    throw std::runtime_error(std::string("Failed to initialize ") + pKeyType + " import");
  }

  EVP_PKEY* pKey = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &pKey, iSelection, params.get()) != 1) {
    throw common::ValidationError("invalid_jwk",
                                  std::string("JWK parameters do not form a valid ") +
                                      pKeyType + " key");
  }
  return makeEvpPkeyPtr(pKey);
}

std::string readBio(BIO* pBio) {
  char* pData = nullptr;
  const long lLen = BIO_get_mem_data(pBio, &pData);
  if (lLen <= 0 || pData == nullptr) {
    throw std::runtime_error("PEM output is empty");
  }
  return std::string(pData, static_cast<size_t>(lLen));
}

void requireStringMembers(const nlohmann::json& jKey, std::initializer_list<const char*> ilNames) {
  for (const char* pName : ilNames) {
    if (!jKey.contains(pName) || !jKey[pName].is_string()) {
      throw common::ValidationError(
          "invalid_jwk", std::string("JWK is missing string member '") + pName + "'");
    }
  }
}

}  // namespace

// ── Construction ───────────────────────────────────────────────────────────

JsonWebKey JsonWebKey::fromJson(const nlohmann::json& jKey) {
  if (!jKey.is_object()) {
    throw common::ValidationError("invalid_jwk", "JWK must be a JSON object");
  }
  requireStringMembers(jKey, {"kty"});

  const std::string sKty = jKey["kty"].get<std::string>();
  if (sKty == "RSA") {
    requireStringMembers(jKey, {"n", "e"});
    if (jKey.contains("d")) {
      requireStringMembers(jKey, {"d", "p", "q", "dp", "dq", "qi"});
    }
  } else if (sKty == "EC") {
    requireStringMembers(jKey, {"crv", "x", "y"});
    (void)curveByJwkName(jKey["crv"].get<std::string>());
    if (jKey.contains("d")) {
      requireStringMembers(jKey, {"d"});
    }
  } else if (sKty == "oct") {
    requireStringMembers(jKey, {"k"});
  } else {
    throw common::ValidationError("invalid_jwk", "Unsupported JWK kty: " + sKty);
  }

  for (const char* pName : {"kid", "alg", "use"}) {
    if (jKey.contains(pName) && !jKey[pName].is_string()) {
      throw common::ValidationError(
          "invalid_jwk", std::string("JWK member '") + pName + "' must be a string");
    }
  }

  return JsonWebKey(jKey);
}

JsonWebKey JsonWebKey::fromEvpPkey(const EVP_PKEY* pKey, const std::string& sKeyId,
                                   const std::string& sAlgorithm, const std::string& sUse) {
  nlohmann::json jKey = nlohmann::json::object();

  if (EVP_PKEY_is_a(pKey, "RSA")) {
    jKey["kty"] = "RSA";
    jKey["n"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_N);
    jKey["e"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_E);

    if (auto oD = tryBnParam(pKey, OSSL_PKEY_PARAM_RSA_D)) {
      jKey["d"] = *oD;
      jKey["p"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_FACTOR1);
      jKey["q"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_FACTOR2);
      jKey["dp"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_EXPONENT1);
      jKey["dq"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_EXPONENT2);
      jKey["qi"] = bnParam(pKey, OSSL_PKEY_PARAM_RSA_COEFFICIENT1);
    }
  } else if (EVP_PKEY_is_a(pKey, "EC")) {
    char vGroup[64] = {};
    size_t nGroupLen = 0;
    if (EVP_PKEY_get_utf8_string_param(pKey, OSSL_PKEY_PARAM_GROUP_NAME, vGroup,
                                       sizeof(vGroup), &nGroupLen) != 1) {
      throw std::runtime_error("Failed to read EC group name");
    }
    const auto& ci = curveByGroupName(std::string(vGroup, nGroupLen));

    jKey["kty"] = "EC";
    jKey["crv"] = ci.pJwkName;
    jKey["x"] = bnParam(pKey, OSSL_PKEY_PARAM_EC_PUB_X, ci.nCoordinateLen);
    jKey["y"] = bnParam(pKey, OSSL_PKEY_PARAM_EC_PUB_Y, ci.nCoordinateLen);
    if (auto oD = tryBnParam(pKey, OSSL_PKEY_PARAM_PRIV_KEY, ci.nCoordinateLen)) {
      jKey["d"] = *oD;
    }
  } else {
    throw common::ValidationError("invalid_jwk", "Only RSA and EC keys can be exported");
  }

  jKey["kid"] = sKeyId;
  jKey["alg"] = sAlgorithm;
  jKey["use"] = sUse;
  return JsonWebKey(std::move(jKey));
}

JsonWebKey JsonWebKey::fromSymmetricKey(const std::vector<unsigned char>& vSecret,
                                        const std::string& sKeyId,
                                        const std::string& sAlgorithm,
                                        const std::string& sUse) {
  if (vSecret.empty()) {
    throw common::ValidationError("invalid_jwk", "Symmetric key cannot be empty");
  }
  nlohmann::json jKey = {
      {"kty", "oct"},
      {"k", base64url::encode(vSecret)},
      {"kid", sKeyId},
      {"alg", sAlgorithm},
      {"use", sUse}};
  return JsonWebKey(std::move(jKey));
}

// ── Accessors ──────────────────────────────────────────────────────────────

std::string JsonWebKey::member(const char* pName) const {
  auto it = _jKey.find(pName);
  if (it == _jKey.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::string JsonWebKey::keyId() const { return member("kid"); }
std::string JsonWebKey::keyType() const { return member("kty"); }
std::string JsonWebKey::algorithm() const { return member("alg"); }
std::string JsonWebKey::use() const { return member("use"); }

bool JsonWebKey::hasPrivateKey() const {
  if (isSymmetric()) {
    return _jKey.contains("k");
  }
  return _jKey.contains("d");
}

JsonWebKey JsonWebKey::toPublic() const {
  if (isSymmetric()) {
    throw common::ValidationError("symmetric_key", "Symmetric keys have no public form");
  }
  nlohmann::json jPublic = _jKey;
  for (const char* pName : kRsaPrivateMembers) {
    jPublic.erase(pName);
  }
  jPublic.erase("oth");
  return JsonWebKey(std::move(jPublic));
}

std::vector<unsigned char> JsonWebKey::symmetricKey() const {
  if (!isSymmetric()) {
    throw common::ValidationError("not_symmetric", "JWK kty is not oct");
  }
  return base64url::decodeBytes(member("k"));
}

// ── OpenSSL conversion ─────────────────────────────────────────────────────

EvpPkeyPtr JsonWebKey::toEvpPkey(bool bPrivate) const {
  if (bPrivate && !hasPrivateKey()) {
    throw common::ValidationError("missing_private_key", "JWK has no private key members");
  }

  ParamBldPtr bld(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
  if (!bld) {
    throw std::runtime_error("OSSL_PARAM_BLD_new failed");
  }
  const int iSelection = bPrivate ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
  const std::string sKty = keyType();

  if (sKty == "RSA") {
    auto n = decodeBignum(_jKey, "n");
    auto e = decodeBignum(_jKey, "e");
    if (OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1) {
      throw std::runtime_error("Failed to push RSA public parameters");
    }
    if (!bPrivate) {
      return fromData("RSA", bld.get(), iSelection);
    }

    auto d = decodeBignum(_jKey, "d");
    auto p = decodeBignum(_jKey, "p");
    auto q = decodeBignum(_jKey, "q");
    auto dp = decodeBignum(_jKey, "dp");
    auto dq = decodeBignum(_jKey, "dq");
    auto qi = decodeBignum(_jKey, "qi");
    if (OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_D, d.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR1, p.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR2, q.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT1, dp.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT2, dq.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_COEFFICIENT1, qi.get()) != 1) {
      throw std::runtime_error("Failed to push RSA private parameters");
    }
    return fromData("RSA", bld.get(), iSelection);
  }

  if (sKty == "EC") {
    const auto& ci = curveByJwkName(member("crv"));
    const auto vX = base64url::decodeBytes(member("x"));
    const auto vY = base64url::decodeBytes(member("y"));
    if (vX.size() != ci.nCoordinateLen || vY.size() != ci.nCoordinateLen) {
      throw common::ValidationError("invalid_jwk", "EC coordinate length does not match curve");
    }

    // Uncompressed point: 0x04 || x || y
    std::vector<unsigned char> vPoint;
    vPoint.reserve(1 + vX.size() + vY.size());
    vPoint.push_back(0x04);
    vPoint.insert(vPoint.end(), vX.begin(), vX.end());
    vPoint.insert(vPoint.end(), vY.begin(), vY.end());

    if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                        ci.pGroupName, 0) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                         vPoint.data(), vPoint.size()) != 1) {
      throw std::runtime_error("Failed to push EC public parameters");
    }
    if (!bPrivate) {
      return fromData("EC", bld.get(), iSelection);
    }

    auto d = decodeBignum(_jKey, "d");
    if (OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, d.get()) != 1) {
      throw std::runtime_error("Failed to push EC private parameter");
    }
    return fromData("EC", bld.get(), iSelection);
  }

  throw common::ValidationError("invalid_jwk", "JWK kty '" + sKty + "' has no OpenSSL key form");
}

std::string JsonWebKey::toPrivatePem() const {
  auto pKey = toEvpPkey(true);
  BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio) {
    throw std::runtime_error("Failed to allocate memory BIO");
  }
  if (PEM_write_bio_PrivateKey(bio.get(), pKey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM_write_bio_PrivateKey failed");
  }
  return readBio(bio.get());
}

std::string JsonWebKey::toPublicPem() const {
  auto pKey = toEvpPkey(false);
  BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio) {
    throw std::runtime_error("Failed to allocate memory BIO");
  }
  if (PEM_write_bio_PUBKEY(bio.get(), pKey.get()) != 1) {
    throw std::runtime_error("PEM_write_bio_PUBKEY failed");
  }
  return readBio(bio.get());
}

}  // namespace jwks::security
