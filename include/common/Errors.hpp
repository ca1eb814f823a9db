#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace jwks::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed keys, tokens or options.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 400 Bad Request: unknown JOSE "alg" or "enc" name.
struct UnsupportedAlgorithmError : AppError {
  explicit UnsupportedAlgorithmError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 401 Unauthorized: token signature, decryption or claim failures.
struct AuthenticationError : AppError {
  explicit AuthenticationError(std::string sCode, std::string sMsg)
      : AppError(401, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested key does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: key id already stored.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: key store could not read or persist keys.
struct KeyStoreError : AppError {
  explicit KeyStoreError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace jwks::common
