#include "core/JwksOptions.hpp"

#include "common/Errors.hpp"

#include <string>

namespace jwks::core {

void JwksOptions::validate() const {
  if (jwsAlgorithm.keyType() != common::KeyType::Jws) {
    throw common::ValidationError("invalid_options",
                                  jwsAlgorithm.name() + " is not a JWS algorithm");
  }
  if (jweAlgorithm.keyType() != common::KeyType::Jwe) {
    throw common::ValidationError("invalid_options",
                                  jweAlgorithm.name() + " is not a JWE algorithm");
  }
  if (iDaysUntilExpire < 1 || iDaysUntilExpire > kMaxDaysUntilExpire) {
    throw common::ValidationError("invalid_options",
                                  "Days until expire must be between 1 and " +
                                      std::to_string(kMaxDaysUntilExpire));
  }
  if (iAlgorithmsToKeep < 1) {
    throw common::ValidationError("invalid_options", "Algorithms to keep must be at least 1");
  }
}

JwksOptions JwksOptions::fromConfig(const common::Config& cfg) {
  JwksOptions jo;
  jo.jwsAlgorithm = security::Algorithm::jws(cfg.sJwsAlgorithm);
  jo.jweAlgorithm = security::Algorithm::jwe(cfg.sJweAlgorithm, cfg.sJweEncryption);
  jo.iDaysUntilExpire = cfg.iDaysUntilExpire;
  if (!cfg.sKeyPrefix.empty()) jo.sKeyPrefix = cfg.sKeyPrefix;
  jo.iAlgorithmsToKeep = cfg.iAlgorithmsToKeep;
  jo.validate();
  return jo;
}

}  // namespace jwks::core
