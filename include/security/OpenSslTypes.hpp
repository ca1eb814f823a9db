#pragma once

#include <memory>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/params.h>

namespace jwks::security {

/// Owning handles for the OpenSSL objects that cross function boundaries.
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

inline EvpPkeyPtr makeEvpPkeyPtr(EVP_PKEY* pKey) { return EvpPkeyPtr(pKey, &EVP_PKEY_free); }

}  // namespace jwks::security
