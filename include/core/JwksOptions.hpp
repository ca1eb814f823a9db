#pragma once

#include <string>

#include "common/Config.hpp"
#include "security/Algorithm.hpp"

namespace jwks::core {

/// Upper bound for iDaysUntilExpire.
inline constexpr int kMaxDaysUntilExpire = 36500;

/// Key generation and rotation settings. Can be swapped at run time via
/// JwksService::setOptions.
/// Class abbreviation: jo
struct JwksOptions {
  security::Algorithm jwsAlgorithm = security::JwsAlgorithm::ES256;
  security::Algorithm jweAlgorithm = security::JweAlgorithm::RsaOaepAes128CbcHmacSha256;
  int iDaysUntilExpire = 90;
  std::string sKeyPrefix = common::Config::defaultKeyPrefix();
  int iAlgorithmsToKeep = 2;

  /// Throws ValidationError when an algorithm has the wrong key type or a
  /// count is below 1.
  void validate() const;

  static JwksOptions fromConfig(const common::Config& cfg);
};

}  // namespace jwks::core
