#include "security/JwtHandler.hpp"

#include "common/Errors.hpp"
#include "security/Algorithm.hpp"
#include "security/JweCipher.hpp"

#include <jwt-cpp/traits/nlohmann-json/defaults.h>

#include <cstdint>
#include <stdexcept>

namespace jwks::security {

namespace {

constexpr auto kDefaultLifetime = std::chrono::minutes(60);

// Large enough to disable jwt-cpp's exp/nbf/iat checks when lifetime
// validation is off.
constexpr size_t kNoLifetimeLeeway = 100ULL * 365 * 24 * 3600;

std::string secretOf(const JsonWebKey& jwk) {
  const auto vSecret = jwk.symmetricKey();
  return std::string(vSecret.begin(), vSecret.end());
}

/// Call fn with the jwt-cpp algorithm object for sAlg. Signing loads the
/// private key, verification the public key.
template <typename Fn>
decltype(auto) withAlgorithm(const std::string& sAlg, const JsonWebKey& jwk, bool bSign, Fn&& fn) {
  const auto eFamily = Algorithm::jws(sAlg).family();
  if (eFamily == KeyFamily::Hmac) {
    if (!jwk.isSymmetric()) {
      throw common::ValidationError("invalid_key", sAlg + " requires an oct key");
    }
    const std::string sSecret = secretOf(jwk);
    if (sAlg == "HS256") return fn(jwt::algorithm::hs256{sSecret});
    if (sAlg == "HS384") return fn(jwt::algorithm::hs384{sSecret});
    return fn(jwt::algorithm::hs512{sSecret});
  }

  if (jwk.isSymmetric()) {
    throw common::ValidationError("invalid_key", sAlg + " requires an asymmetric key");
  }
  const std::string sPublicPem = bSign ? std::string() : jwk.toPublicPem();
  const std::string sPrivatePem = bSign ? jwk.toPrivatePem() : std::string();

  if (sAlg == "RS256") return fn(jwt::algorithm::rs256(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "RS384") return fn(jwt::algorithm::rs384(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "RS512") return fn(jwt::algorithm::rs512(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "PS256") return fn(jwt::algorithm::ps256(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "PS384") return fn(jwt::algorithm::ps384(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "PS512") return fn(jwt::algorithm::ps512(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "ES256") return fn(jwt::algorithm::es256(sPublicPem, sPrivatePem, "", ""));
  if (sAlg == "ES384") return fn(jwt::algorithm::es384(sPublicPem, sPrivatePem, "", ""));
  return fn(jwt::algorithm::es512(sPublicPem, sPrivatePem, "", ""));
}

std::optional<std::chrono::system_clock::time_point> numericDate(const nlohmann::json& jClaims,
                                                                 const char* pName) {
  if (!jClaims.contains(pName) || !jClaims[pName].is_number()) return std::nullopt;
  return std::chrono::system_clock::time_point(
      std::chrono::seconds(jClaims[pName].get<int64_t>()));
}

std::string verificationCode(const std::error_code& ec) {
  if (ec == jwt::error::token_verification_error::token_expired) return "token_expired";
  if (ec == jwt::error::token_verification_error::audience_missmatch) return "invalid_audience";
  if (ec == jwt::error::token_verification_error::claim_value_missmatch) return "invalid_issuer";
  if (ec == jwt::error::token_verification_error::missing_claim) return "missing_claim";
  if (ec == jwt::error::token_verification_error::wrong_algorithm) return "invalid_algorithm";
  return "invalid_token";
}

}  // namespace

TokenValidationResult JwtHandler::fail(std::string sErrorCode, std::string sMessage) {
  TokenValidationResult tvr;
  tvr.sErrorCode = std::move(sErrorCode);
  tvr.sMessage = std::move(sMessage);
  return tvr;
}

// ── Create ─────────────────────────────────────────────────────────────────

std::string JwtHandler::createToken(const TokenDescriptor& td) {
  const auto tpNow = std::chrono::system_clock::now();

  auto builder = jwt::create();
  builder.set_type("JWT")
      .set_issued_at(td.oIssuedAt.value_or(tpNow))
      .set_not_before(td.oNotBefore.value_or(tpNow))
      .set_expires_at(td.oExpires.value_or(tpNow + kDefaultLifetime));
  if (!td.sIssuer.empty()) builder.set_issuer(td.sIssuer);
  if (!td.sAudience.empty()) builder.set_audience(td.sAudience);

  if (td.jClaims.is_object()) {
    for (const auto& item : td.jClaims.items()) {
      builder.set_payload_claim(item.key(), jwt::claim(item.value()));
    }
  }

  std::string sJwt;
  if (td.oSigningCredentials) {
    const auto& sc = *td.oSigningCredentials;
    builder.set_key_id(sc.sKid);
    sJwt = withAlgorithm(sc.sAlgorithm, sc.jwkKey, true,
                         [&](const auto& algo) { return builder.sign(algo); });
  } else {
    sJwt = builder.sign(jwt::algorithm::none{});
  }

  if (!td.oEncryptingCredentials) {
    return sJwt;
  }
  return JweCipher::encrypt(sJwt, *td.oEncryptingCredentials,
                            nlohmann::json{{"typ", "JWT"}, {"cty", "JWT"}});
}

// ── Validate ───────────────────────────────────────────────────────────────

TokenValidationResult JwtHandler::validateToken(const std::string& sToken,
                                                const TokenValidationParameters& tvp) {
  std::string sInner = sToken;
  bool bWasEncrypted = false;

  if (JweCipher::isJwe(sToken)) {
    if (!tvp.oTokenDecryptionKey) {
      return fail("decryption_key_missing", "Token is encrypted but no decryption key was given");
    }
    try {
      const auto jHeader = JweCipher::readHeader(sToken);
      const std::string sKeyKid = tvp.oTokenDecryptionKey->keyId();
      if (jHeader.contains("kid") && jHeader["kid"].is_string() && !sKeyKid.empty() &&
          jHeader["kid"].get<std::string>() != sKeyKid) {
        return fail("decryption_key_not_found",
                    "No decryption key for kid " + jHeader["kid"].get<std::string>());
      }
      sInner = JweCipher::decrypt(sToken, *tvp.oTokenDecryptionKey).sPlaintext;
    } catch (const common::AppError& e) {
      return fail(e._sErrorCode, e.what());
    } catch (const std::runtime_error& e) {
      return fail("decryption_failed", e.what());
    }
    bWasEncrypted = true;
  }

  std::optional<jwt::decoded_jwt<jwt::traits::nlohmann_json>> oDecoded;
  TokenValidationResult tvr;
  tvr.bWasEncrypted = bWasEncrypted;
  std::string sAlg;
  try {
    oDecoded.emplace(jwt::decode(sInner));
    tvr.jClaims = nlohmann::json(oDecoded->get_payload_json());
    if (oDecoded->has_key_id()) tvr.sKeyId = oDecoded->get_key_id();
    sAlg = oDecoded->get_algorithm();
  } catch (const std::exception& e) {
    return fail("invalid_token", std::string("Token is not a well-formed JWT: ") + e.what());
  }
  const auto& decoded = *oDecoded;

  const size_t nLeeway = tvp.bValidateLifetime
                             ? static_cast<size_t>(tvp.durClockSkew.count())
                             : kNoLifetimeLeeway;
  if (tvp.bValidateLifetime) {
    const auto tpNow = std::chrono::system_clock::now();
    const auto oExp = numericDate(tvr.jClaims, "exp");
    if (oExp && *oExp + tvp.durClockSkew < tpNow) {
      return fail("token_expired", "Token lifetime has expired");
    }
    const auto oNbf = numericDate(tvr.jClaims, "nbf");
    if (oNbf && *oNbf - tvp.durClockSkew > tpNow) {
      return fail("token_not_yet_valid", "Token is not valid yet");
    }
  }

  auto verifyWith = [&](const auto& algo) {
    auto verifier = jwt::verify();
    verifier.allow_algorithm(algo).leeway(nLeeway);
    if (!tvp.sValidIssuer.empty()) verifier.with_issuer(tvp.sValidIssuer);
    if (!tvp.sValidAudience.empty()) verifier.with_audience(tvp.sValidAudience);
    verifier.verify(decoded);
  };

  try {
    if (sAlg == "none") {
      if (tvp.bRequireSignedTokens) {
        return fail("unsigned_token", "Unsigned tokens are not accepted");
      }
      verifyWith(jwt::algorithm::none{});
    } else {
      const JsonWebKey* pKey = nullptr;
      for (const auto& jwk : tvp.vIssuerSigningKeys) {
        const bool bKidMatches = tvr.sKeyId.empty() ? tvp.vIssuerSigningKeys.size() == 1
                                                    : jwk.keyId() == tvr.sKeyId;
        if (bKidMatches && (jwk.algorithm().empty() || jwk.algorithm() == sAlg)) {
          pKey = &jwk;
          break;
        }
      }
      if (pKey == nullptr) {
        return fail("signing_key_not_found",
                    "No issuer signing key matches kid '" + tvr.sKeyId + "'");
      }
      withAlgorithm(sAlg, *pKey, false, verifyWith);
    }
  } catch (const jwt::error::signature_verification_exception& e) {
    return fail("invalid_signature", e.what());
  } catch (const jwt::error::token_verification_exception& e) {
    return fail(verificationCode(e.code()), e.what());
  } catch (const common::AppError& e) {
    return fail(e._sErrorCode, e.what());
  } catch (const std::runtime_error& e) {
    return fail("invalid_key", e.what());
  } catch (const std::exception& e) {
    // e.g. std::bad_cast from a claim of the wrong JSON type
    return fail("invalid_token", e.what());
  }

  tvr.bIsValid = true;
  return tvr;
}

}  // namespace jwks::security
