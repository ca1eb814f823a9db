#include "security/CryptoService.hpp"

#include "common/Errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace jwks::security {

namespace {
constexpr size_t kMasterKeyLen = 32;  // AES-256
constexpr int kIvLen = 12;            // GCM standard IV
constexpr int kTagLen = 16;           // GCM tag

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const EVP_CIPHER* gcmCipherForKey(size_t nKeyLen) {
  switch (nKeyLen) {
    case 16: return EVP_aes_128_gcm();
    case 24: return EVP_aes_192_gcm();
    case 32: return EVP_aes_256_gcm();
    default:
      throw std::runtime_error("Invalid AES-GCM key length: " + std::to_string(nKeyLen));
  }
}

std::string toHex(const unsigned char* pData, size_t nLen) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < nLen; ++i) {
    oss << std::setw(2) << static_cast<int>(pData[i]);
  }
  return oss.str();
}

}  // namespace

// ── Hex decode ─────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::hexDecode(const std::string& sHex) {
  if (sHex.size() % 2 != 0) {
    throw std::runtime_error("Invalid hex string: odd length");
  }
  std::vector<unsigned char> vResult;
  vResult.reserve(sHex.size() / 2);
  for (size_t i = 0; i < sHex.size(); i += 2) {
    unsigned int iByte = 0;
    std::istringstream iss(sHex.substr(i, 2));
    iss >> std::hex >> iByte;
    if (iss.fail()) {
      throw std::runtime_error("Invalid hex character at position " + std::to_string(i));
    }
    vResult.push_back(static_cast<unsigned char>(iByte));
  }
  return vResult;
}

// ── Base64 encode/decode ───────────────────────────────────────────────────

std::string CryptoService::base64Encode(const std::vector<unsigned char>& vData) {
  // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL, no newlines
  std::string sOut(((vData.size() + 2) / 3) * 4 + 1, '\0');
  const int iLen = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(sOut.data()),
                                   vData.data(), static_cast<int>(vData.size()));
  if (iLen < 0) {
    throw std::runtime_error("Base64 encode failed");
  }
  sOut.resize(static_cast<size_t>(iLen));
  return sOut;
}

std::vector<unsigned char> CryptoService::base64Decode(const std::string& sEncoded) {
  if (sEncoded.size() % 4 != 0) {
    throw common::ValidationError("invalid_ciphertext", "Base64 input has invalid length");
  }
  std::vector<unsigned char> vOut(sEncoded.size() / 4 * 3 + 1);
  const int iLen = EVP_DecodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sEncoded.data()),
                                   static_cast<int>(sEncoded.size()));
  if (iLen < 0) {
    throw common::ValidationError("invalid_ciphertext", "Base64 decode failed");
  }

  // EVP_DecodeBlock counts padding bytes as output; trim them
  size_t nLen = static_cast<size_t>(iLen);
  for (auto it = sEncoded.rbegin(); it != sEncoded.rend() && *it == '=' && nLen > 0; ++it) {
    --nLen;
  }
  vOut.resize(nLen);
  return vOut;
}

// ── Constructor / Destructor ───────────────────────────────────────────────

CryptoService::CryptoService(std::string sMasterKeyHex) {
  if (sMasterKeyHex.size() != kMasterKeyLen * 2) {
    throw std::runtime_error(
        "JWKS_MASTER_KEY must be a 64-character hex string (32 bytes), got " +
        std::to_string(sMasterKeyHex.size()) + " characters");
  }

  _vMasterKey = hexDecode(sMasterKeyHex);

  // Zero the raw hex string from memory
  OPENSSL_cleanse(sMasterKeyHex.data(), sMasterKeyHex.size());
}

CryptoService::~CryptoService() {
  if (!_vMasterKey.empty()) {
    OPENSSL_cleanse(_vMasterKey.data(), _vMasterKey.size());
  }
}

// ── AES-GCM primitives ─────────────────────────────────────────────────────

GcmSealed CryptoService::aesGcmSeal(const std::vector<unsigned char>& vKey,
                                    const std::vector<unsigned char>& vIv,
                                    const std::string& sPlaintext,
                                    const std::string& sAad) {
  if (vIv.size() != static_cast<size_t>(kIvLen)) {
    throw std::runtime_error("AES-GCM IV must be 12 bytes");
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create cipher context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), gcmCipherForKey(vKey.size()), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, vKey.data(), vIv.data()) != 1) {
    throw std::runtime_error("Failed to initialize AES-GCM encryption");
  }

  int iOutLen = 0;
  if (!sAad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &iOutLen,
                        reinterpret_cast<const unsigned char*>(sAad.data()),
                        static_cast<int>(sAad.size())) != 1) {
    throw std::runtime_error("Failed to process AES-GCM associated data");
  }

  GcmSealed gs;
  gs.vCiphertext.resize(sPlaintext.size() + static_cast<size_t>(kTagLen));
  if (EVP_EncryptUpdate(ctx.get(), gs.vCiphertext.data(), &iOutLen,
                        reinterpret_cast<const unsigned char*>(sPlaintext.data()),
                        static_cast<int>(sPlaintext.size())) != 1) {
    throw std::runtime_error("Encryption failed");
  }
  int iCiphertextLen = iOutLen;

  if (EVP_EncryptFinal_ex(ctx.get(), gs.vCiphertext.data() + iCiphertextLen, &iOutLen) != 1) {
    throw std::runtime_error("Encryption finalization failed");
  }
  iCiphertextLen += iOutLen;
  gs.vCiphertext.resize(static_cast<size_t>(iCiphertextLen));

  gs.vTag.resize(kTagLen);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, gs.vTag.data()) != 1) {
    throw std::runtime_error("Failed to get GCM tag");
  }
  return gs;
}

std::string CryptoService::aesGcmOpen(const std::vector<unsigned char>& vKey,
                                      const std::vector<unsigned char>& vIv,
                                      const std::vector<unsigned char>& vCiphertext,
                                      const std::vector<unsigned char>& vTag,
                                      const std::string& sAad) {
  if (vIv.size() != static_cast<size_t>(kIvLen)) {
    throw common::ValidationError("invalid_ciphertext", "Invalid IV length");
  }
  if (vTag.size() != static_cast<size_t>(kTagLen)) {
    throw common::ValidationError("invalid_ciphertext", "Invalid GCM tag length");
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create cipher context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), gcmCipherForKey(vKey.size()), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, vKey.data(), vIv.data()) != 1) {
    throw std::runtime_error("Failed to initialize AES-GCM decryption");
  }

  int iOutLen = 0;
  if (!sAad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &iOutLen,
                        reinterpret_cast<const unsigned char*>(sAad.data()),
                        static_cast<int>(sAad.size())) != 1) {
    throw std::runtime_error("Failed to process AES-GCM associated data");
  }

  std::vector<unsigned char> vPlaintext(vCiphertext.size() + 1);
  if (EVP_DecryptUpdate(ctx.get(), vPlaintext.data(), &iOutLen,
                        vCiphertext.data(), static_cast<int>(vCiphertext.size())) != 1) {
    throw std::runtime_error("Decryption failed");
  }
  int iPlaintextLen = iOutLen;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen,
                          const_cast<unsigned char*>(vTag.data())) != 1) {
    throw std::runtime_error("Failed to set GCM tag for verification");
  }

  // Final step verifies the tag
  if (EVP_DecryptFinal_ex(ctx.get(), vPlaintext.data() + iPlaintextLen, &iOutLen) != 1) {
    OPENSSL_cleanse(vPlaintext.data(), vPlaintext.size());
    throw common::AuthenticationError("decryption_failed",
                                      "GCM tag verification failed (data tampered or wrong key)");
  }
  iPlaintextLen += iOutLen;

  return std::string(reinterpret_cast<char*>(vPlaintext.data()),
                     static_cast<size_t>(iPlaintextLen));
}

// ── Master key encrypt / decrypt ───────────────────────────────────────────

std::string CryptoService::encrypt(const std::string& sPlaintext,
                                   const std::string& sAssociatedData) const {
  const auto vIv = randomBytes(kIvLen);
  auto gs = aesGcmSeal(_vMasterKey, vIv, sPlaintext, sAssociatedData);

  gs.vCiphertext.insert(gs.vCiphertext.end(), gs.vTag.begin(), gs.vTag.end());
  return base64Encode(vIv) + ":" + base64Encode(gs.vCiphertext);
}

std::string CryptoService::decrypt(const std::string& sCiphertext,
                                   const std::string& sAssociatedData) const {
  const auto nSep = sCiphertext.find(':');
  if (nSep == std::string::npos) {
    throw common::ValidationError("invalid_ciphertext", "Ciphertext missing IV:data separator");
  }

  const auto vIv = base64Decode(sCiphertext.substr(0, nSep));
  const auto vData = base64Decode(sCiphertext.substr(nSep + 1));
  if (vData.size() < static_cast<size_t>(kTagLen)) {
    throw common::ValidationError("invalid_ciphertext", "Ciphertext too short for GCM tag");
  }

  const auto itTag = vData.end() - kTagLen;
  const std::vector<unsigned char> vCipher(vData.begin(), itTag);
  const std::vector<unsigned char> vTag(itTag, vData.end());
  return aesGcmOpen(_vMasterKey, vIv, vCipher, vTag, sAssociatedData);
}

// ── Random ─────────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::randomBytes(size_t nBytes) {
  std::vector<unsigned char> vBytes(nBytes);
  if (nBytes > 0 && RAND_bytes(vBytes.data(), static_cast<int>(nBytes)) != 1) {
    throw std::runtime_error("Failed to generate random bytes");
  }
  return vBytes;
}

std::string CryptoService::generateUuid() {
  auto vBytes = randomBytes(16);
  vBytes[6] = static_cast<unsigned char>((vBytes[6] & 0x0f) | 0x40);  // version 4
  vBytes[8] = static_cast<unsigned char>((vBytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

  const std::string sHex = toHex(vBytes.data(), vBytes.size());
  return sHex.substr(0, 8) + "-" + sHex.substr(8, 4) + "-" + sHex.substr(12, 4) + "-" +
         sHex.substr(16, 4) + "-" + sHex.substr(20);
}

// ── SHA-256 ────────────────────────────────────────────────────────────────

std::string CryptoService::sha256Hex(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  if (EVP_Digest(sInput.data(), sInput.size(), vHash, &uHashLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 hash computation failed");
  }
  return toHex(vHash, uHashLen);
}

}  // namespace jwks::security
