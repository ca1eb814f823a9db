#include "security/Base64Url.hpp"

#include "common/Errors.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace jwks::security::base64url {

namespace {

std::string encodeRaw(const unsigned char* pData, size_t nLen) {
  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }
  EVP_EncodeInit(pCtx);

  // Output buffer: 4/3 * input + padding + newlines + null
  std::vector<unsigned char> vOut(nLen * 2 + 64);
  int iOutLen = 0;
  int iTotalLen = 0;

  if (nLen > 0 &&
      EVP_EncodeUpdate(pCtx, vOut.data(), &iOutLen, pData, static_cast<int>(nLen)) != 1) {
    EVP_ENCODE_CTX_free(pCtx);
    throw std::runtime_error("Base64 encode failed");
  }
  iTotalLen += iOutLen;
  EVP_EncodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  iTotalLen += iOutLen;
  EVP_ENCODE_CTX_free(pCtx);

  std::string sB64(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iTotalLen));
  // Remove newlines that EVP_Encode adds
  std::erase(sB64, '\n');
  for (auto& c : sB64) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  while (!sB64.empty() && sB64.back() == '=') {
    sB64.pop_back();
  }
  return sB64;
}

}  // namespace

std::string encode(const std::string& sInput) {
  return encodeRaw(reinterpret_cast<const unsigned char*>(sInput.data()), sInput.size());
}

std::string encode(const std::vector<unsigned char>& vInput) {
  return encodeRaw(vInput.data(), vInput.size());
}

std::vector<unsigned char> decodeBytes(const std::string& sInput) {
  std::string sB64 = sInput;
  while (!sB64.empty() && sB64.back() == '=') {
    sB64.pop_back();
  }
  for (auto& c : sB64) {
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
    else if (c == '+' || c == '/') {
      throw common::ValidationError("invalid_base64url", "Input is not base64url encoded");
    }
  }
  if (sB64.size() % 4 == 1) {
    throw common::ValidationError("invalid_base64url", "Truncated base64url input");
  }
  while (sB64.size() % 4 != 0) {
    sB64 += '=';
  }

  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }
  EVP_DecodeInit(pCtx);

  std::vector<unsigned char> vOut(sB64.size() + 3);
  int iOutLen = 0;
  int iTotalLen = 0;

  int iRet = EVP_DecodeUpdate(pCtx, vOut.data(), &iOutLen,
                              reinterpret_cast<const unsigned char*>(sB64.data()),
                              static_cast<int>(sB64.size()));
  if (iRet < 0) {
    EVP_ENCODE_CTX_free(pCtx);
    throw common::ValidationError("invalid_base64url", "Failed to decode base64url input");
  }
  iTotalLen += iOutLen;
  iRet = EVP_DecodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  EVP_ENCODE_CTX_free(pCtx);
  if (iRet < 0) {
    throw common::ValidationError("invalid_base64url", "Failed to decode base64url input");
  }
  iTotalLen += iOutLen;

  vOut.resize(static_cast<size_t>(iTotalLen));
  return vOut;
}

std::string decode(const std::string& sInput) {
  const auto vBytes = decodeBytes(sInput);
  return std::string(vBytes.begin(), vBytes.end());
}

}  // namespace jwks::security::base64url
