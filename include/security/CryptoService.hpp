#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace jwks::security {

/// Output of an AES-GCM seal: ciphertext and 16-byte tag.
struct GcmSealed {
  std::vector<unsigned char> vCiphertext;
  std::vector<unsigned char> vTag;
};

/// AES-GCM primitives and at-rest protection of private key parameters.
/// Master key is stored as raw 32 bytes (decoded from hex at construction).
/// Class abbreviation: cs
class CryptoService {
 public:
  /// Construct from a 64-character hex-encoded master key.
  /// The raw hex string is zeroed via OPENSSL_cleanse after decoding.
  explicit CryptoService(std::string sMasterKeyHex);
  ~CryptoService();

  CryptoService(const CryptoService&) = delete;
  CryptoService& operator=(const CryptoService&) = delete;

  /// Encrypt with AES-256-GCM under the master key and a per-operation 12-byte IV.
  /// sAssociatedData (e.g. the key id) is authenticated but not encrypted.
  /// Returns: base64(iv):base64(ciphertext + tag)
  std::string encrypt(const std::string& sPlaintext,
                      const std::string& sAssociatedData = {}) const;

  /// Decrypt base64(iv):base64(ciphertext + tag). The associated data must
  /// match the value given to encrypt().
  /// Throws ValidationError on malformed input, AuthenticationError on tag mismatch.
  std::string decrypt(const std::string& sCiphertext,
                      const std::string& sAssociatedData = {}) const;

  /// AES-GCM with a 16, 24 or 32 byte key and a 12-byte IV.
  static GcmSealed aesGcmSeal(const std::vector<unsigned char>& vKey,
                              const std::vector<unsigned char>& vIv,
                              const std::string& sPlaintext,
                              const std::string& sAad);

  /// Inverse of aesGcmSeal. Throws AuthenticationError when the tag does not verify.
  static std::string aesGcmOpen(const std::vector<unsigned char>& vKey,
                                const std::vector<unsigned char>& vIv,
                                const std::vector<unsigned char>& vCiphertext,
                                const std::vector<unsigned char>& vTag,
                                const std::string& sAad);

  /// nBytes from the OpenSSL CSPRNG.
  static std::vector<unsigned char> randomBytes(size_t nBytes);

  /// Random RFC 4122 version 4 UUID, lowercase hex with dashes.
  static std::string generateUuid();

  /// SHA-256 hash → 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

 private:
  std::vector<unsigned char> _vMasterKey;  // raw 32 bytes

  static std::string base64Encode(const std::vector<unsigned char>& vData);
  static std::vector<unsigned char> base64Decode(const std::string& sEncoded);
  static std::vector<unsigned char> hexDecode(const std::string& sHex);
};

}  // namespace jwks::security
