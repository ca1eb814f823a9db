#include "security/JweCipher.hpp"

#include "common/Errors.hpp"
#include "security/Algorithm.hpp"
#include "security/Base64Url.hpp"
#include "security/CryptoService.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rsa.h>

#include <cstdint>
#include <memory>
#include <stdexcept>

namespace jwks::security {

namespace {

constexpr size_t kGcmIvLen = 12;
constexpr size_t kCbcIvLen = 16;

/// Content encryption parameters for one "enc" value.
struct ContentSpec {
  bool bGcm;
  size_t nCekLen;
  size_t nIvLen;
  const EVP_CIPHER* pCbcCipher;  // CBC only
  const EVP_MD* pMacDigest;      // CBC only
};

ContentSpec contentSpec(const std::string& sEnc) {
  if (sEnc == "A128GCM") return {true, 16, kGcmIvLen, nullptr, nullptr};
  if (sEnc == "A192GCM") return {true, 24, kGcmIvLen, nullptr, nullptr};
  if (sEnc == "A256GCM") return {true, 32, kGcmIvLen, nullptr, nullptr};
  if (sEnc == "A128CBC-HS256") return {false, 32, kCbcIvLen, EVP_aes_128_cbc(), EVP_sha256()};
  if (sEnc == "A192CBC-HS384") return {false, 48, kCbcIvLen, EVP_aes_192_cbc(), EVP_sha384()};
  if (sEnc == "A256CBC-HS512") return {false, 64, kCbcIvLen, EVP_aes_256_cbc(), EVP_sha512()};
  throw common::UnsupportedAlgorithmError("unsupported_encryption",
                                          "Unsupported JWE content encryption: " + sEnc);
}

const EVP_MD* oaepDigest(const std::string& sAlg) {
  return sAlg == "RSA-OAEP-256" ? EVP_sha256() : EVP_sha1();
}

// ── RSA-OAEP key wrapping ──────────────────────────────────────────────────

std::vector<unsigned char> wrapKey(EVP_PKEY* pKey, const std::string& sAlg,
                                   const std::vector<unsigned char>& vCek) {
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(pKey, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != 1 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), oaepDigest(sAlg)) != 1 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), oaepDigest(sAlg)) != 1) {
    throw std::runtime_error("Failed to initialize " + sAlg + " key wrapping");
  }

  size_t nOutLen = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &nOutLen, vCek.data(), vCek.size()) != 1) {
    throw std::runtime_error("Failed to size wrapped content key");
  }
  std::vector<unsigned char> vWrapped(nOutLen);
  if (EVP_PKEY_encrypt(ctx.get(), vWrapped.data(), &nOutLen, vCek.data(), vCek.size()) != 1) {
    throw std::runtime_error("Content key wrapping failed");
  }
  vWrapped.resize(nOutLen);
  return vWrapped;
}

std::vector<unsigned char> unwrapKey(EVP_PKEY* pKey, const std::string& sAlg,
                                     const std::vector<unsigned char>& vWrapped) {
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(pKey, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != 1 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), oaepDigest(sAlg)) != 1 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), oaepDigest(sAlg)) != 1) {
    throw std::runtime_error("Failed to initialize " + sAlg + " key unwrapping");
  }

  size_t nOutLen = 0;
  if (EVP_PKEY_decrypt(ctx.get(), nullptr, &nOutLen, vWrapped.data(), vWrapped.size()) != 1) {
    throw common::AuthenticationError("decryption_failed", "Encrypted key has an invalid size");
  }
  std::vector<unsigned char> vCek(nOutLen);
  if (EVP_PKEY_decrypt(ctx.get(), vCek.data(), &nOutLen, vWrapped.data(), vWrapped.size()) != 1) {
    throw common::AuthenticationError("decryption_failed",
                                      "Content key unwrapping failed (wrong key?)");
  }
  vCek.resize(nOutLen);
  return vCek;
}

// ── AES-CBC + HMAC-SHA2 (RFC 7518 §5.2.2) ──────────────────────────────────

std::vector<unsigned char> cbcHmacTag(const ContentSpec& cs,
                                      const std::vector<unsigned char>& vMacKey,
                                      const std::string& sAad,
                                      const std::vector<unsigned char>& vIv,
                                      const std::vector<unsigned char>& vCiphertext) {
  // MAC input: AAD || IV || ciphertext || AL (AAD length in bits, 64-bit big endian)
  std::vector<unsigned char> vMacInput(sAad.begin(), sAad.end());
  vMacInput.insert(vMacInput.end(), vIv.begin(), vIv.end());
  vMacInput.insert(vMacInput.end(), vCiphertext.begin(), vCiphertext.end());
  const uint64_t uAadBits = static_cast<uint64_t>(sAad.size()) * 8;
  for (int i = 7; i >= 0; --i) {
    vMacInput.push_back(static_cast<unsigned char>((uAadBits >> (i * 8)) & 0xff));
  }

  unsigned char vMac[EVP_MAX_MD_SIZE];
  unsigned int uMacLen = 0;
  if (!HMAC(cs.pMacDigest, vMacKey.data(), static_cast<int>(vMacKey.size()),
            vMacInput.data(), vMacInput.size(), vMac, &uMacLen)) {
    throw std::runtime_error("HMAC computation failed");
  }
  // Tag is the first half of the MAC output
  return std::vector<unsigned char>(vMac, vMac + cs.nCekLen / 2);
}

std::vector<unsigned char> cbcCrypt(const ContentSpec& cs, bool bEncrypt,
                                    const std::vector<unsigned char>& vEncKey,
                                    const std::vector<unsigned char>& vIv,
                                    const unsigned char* pIn, size_t nInLen) {
  std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(),
                                                                      &EVP_CIPHER_CTX_free);
  if (!ctx || EVP_CipherInit_ex(ctx.get(), cs.pCbcCipher, nullptr, vEncKey.data(), vIv.data(),
                                bEncrypt ? 1 : 0) != 1) {
    throw std::runtime_error("Failed to initialize AES-CBC");
  }

  std::vector<unsigned char> vOut(nInLen + static_cast<size_t>(EVP_MAX_BLOCK_LENGTH));
  int iOutLen = 0;
  if (EVP_CipherUpdate(ctx.get(), vOut.data(), &iOutLen, pIn, static_cast<int>(nInLen)) != 1) {
    throw std::runtime_error("AES-CBC update failed");
  }
  int iTotal = iOutLen;
  if (EVP_CipherFinal_ex(ctx.get(), vOut.data() + iTotal, &iOutLen) != 1) {
    throw common::AuthenticationError("decryption_failed", "AES-CBC padding check failed");
  }
  iTotal += iOutLen;
  vOut.resize(static_cast<size_t>(iTotal));
  return vOut;
}

}  // namespace

// ── Helpers ────────────────────────────────────────────────────────────────

std::vector<std::string> JweCipher::split(const std::string& sToken) {
  std::vector<std::string> vParts;
  size_t nStart = 0;
  while (true) {
    const size_t nDot = sToken.find('.', nStart);
    if (nDot == std::string::npos) {
      vParts.push_back(sToken.substr(nStart));
      break;
    }
    vParts.push_back(sToken.substr(nStart, nDot - nStart));
    nStart = nDot + 1;
  }
  return vParts;
}

bool JweCipher::isJwe(const std::string& sToken) { return split(sToken).size() == 5; }

nlohmann::json JweCipher::readHeader(const std::string& sToken) {
  const auto vParts = split(sToken);
  if (vParts.size() != 5) {
    throw common::ValidationError("invalid_token", "JWE must have five segments");
  }
  nlohmann::json jHeader;
  try {
    jHeader = nlohmann::json::parse(base64url::decode(vParts[0]));
  } catch (const nlohmann::json::exception&) {
    throw common::ValidationError("invalid_token", "JWE header is not valid JSON");
  }
  if (!jHeader.is_object() || !jHeader.contains("alg") || !jHeader["alg"].is_string() ||
      !jHeader.contains("enc") || !jHeader["enc"].is_string()) {
    throw common::ValidationError("invalid_token", "JWE header requires string alg and enc");
  }
  return jHeader;
}

// ── Encrypt ────────────────────────────────────────────────────────────────

std::string JweCipher::encrypt(const std::string& sPlaintext,
                               const EncryptingCredentials& ecCreds,
                               const nlohmann::json& jExtraHeader) {
  // Validates the alg/enc pair
  (void)Algorithm::jwe(ecCreds.sAlg, ecCreds.sEnc);
  const ContentSpec cs = contentSpec(ecCreds.sEnc);

  nlohmann::json jHeader = jExtraHeader.is_object() ? jExtraHeader : nlohmann::json::object();
  jHeader["alg"] = ecCreds.sAlg;
  jHeader["enc"] = ecCreds.sEnc;
  const std::string sKid = ecCreds.jwkKey.keyId();
  if (!sKid.empty()) {
    jHeader["kid"] = sKid;
  }
  const std::string sProtected = base64url::encode(jHeader.dump());

  auto pPublic = ecCreds.jwkKey.toEvpPkey(false);
  auto vCek = CryptoService::randomBytes(cs.nCekLen);
  const auto vIv = CryptoService::randomBytes(cs.nIvLen);
  const auto vWrapped = wrapKey(pPublic.get(), ecCreds.sAlg, vCek);

  std::vector<unsigned char> vCiphertext;
  std::vector<unsigned char> vTag;
  if (cs.bGcm) {
    auto gs = CryptoService::aesGcmSeal(vCek, vIv, sPlaintext, sProtected);
    vCiphertext = std::move(gs.vCiphertext);
    vTag = std::move(gs.vTag);
  } else {
    const std::vector<unsigned char> vMacKey(vCek.begin(), vCek.begin() + cs.nCekLen / 2);
    const std::vector<unsigned char> vEncKey(vCek.begin() + cs.nCekLen / 2, vCek.end());
    vCiphertext = cbcCrypt(cs, true, vEncKey, vIv,
                           reinterpret_cast<const unsigned char*>(sPlaintext.data()),
                           sPlaintext.size());
    vTag = cbcHmacTag(cs, vMacKey, sProtected, vIv, vCiphertext);
  }
  OPENSSL_cleanse(vCek.data(), vCek.size());

  return sProtected + "." + base64url::encode(vWrapped) + "." + base64url::encode(vIv) + "." +
         base64url::encode(vCiphertext) + "." + base64url::encode(vTag);
}

// ── Decrypt ────────────────────────────────────────────────────────────────

JweContent JweCipher::decrypt(const std::string& sToken, const JsonWebKey& jwkKey) {
  const auto vParts = split(sToken);
  JweContent jcResult;
  jcResult.jHeader = readHeader(sToken);

  const std::string sAlg = jcResult.jHeader["alg"].get<std::string>();
  const std::string sEnc = jcResult.jHeader["enc"].get<std::string>();
  (void)Algorithm::jwe(sAlg, sEnc);
  const ContentSpec cs = contentSpec(sEnc);

  if (jwkKey.keyType() != "RSA") {
    throw common::ValidationError("invalid_key", "JWE decryption requires an RSA key");
  }
  auto pPrivate = jwkKey.toEvpPkey(true);

  const auto vWrapped = base64url::decodeBytes(vParts[1]);
  const auto vIv = base64url::decodeBytes(vParts[2]);
  const auto vCiphertext = base64url::decodeBytes(vParts[3]);
  const auto vTag = base64url::decodeBytes(vParts[4]);
  if (vIv.size() != cs.nIvLen) {
    throw common::ValidationError("invalid_token", "JWE IV has the wrong length for " + sEnc);
  }

  auto vCek = unwrapKey(pPrivate.get(), sAlg, vWrapped);
  if (vCek.size() != cs.nCekLen) {
    OPENSSL_cleanse(vCek.data(), vCek.size());
    throw common::AuthenticationError("decryption_failed",
                                      "Content key has the wrong length for " + sEnc);
  }

  const std::string& sAad = vParts[0];
  if (cs.bGcm) {
    try {
      jcResult.sPlaintext = CryptoService::aesGcmOpen(vCek, vIv, vCiphertext, vTag, sAad);
    } catch (const common::AppError&) {
      OPENSSL_cleanse(vCek.data(), vCek.size());
      throw;
    }
    OPENSSL_cleanse(vCek.data(), vCek.size());
    return jcResult;
  }

  const std::vector<unsigned char> vMacKey(vCek.begin(), vCek.begin() + cs.nCekLen / 2);
  const std::vector<unsigned char> vEncKey(vCek.begin() + cs.nCekLen / 2, vCek.end());
  OPENSSL_cleanse(vCek.data(), vCek.size());

  const auto vExpectedTag = cbcHmacTag(cs, vMacKey, sAad, vIv, vCiphertext);
  if (vTag.size() != vExpectedTag.size() ||
      CRYPTO_memcmp(vTag.data(), vExpectedTag.data(), vTag.size()) != 0) {
    throw common::AuthenticationError("decryption_failed",
                                      "JWE authentication tag verification failed");
  }

  const auto vPlain = cbcCrypt(cs, false, vEncKey, vIv, vCiphertext.data(), vCiphertext.size());
  jcResult.sPlaintext.assign(vPlain.begin(), vPlain.end());
  return jcResult;
}

}  // namespace jwks::security
