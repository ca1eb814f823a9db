#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "security/JsonWebKey.hpp"

namespace jwks::security {

/// A stored key: its private JWK plus rotation and revocation state.
/// Class abbreviation: km
struct KeyMaterial {
  std::string sId;          // random UUID, stable storage identity
  std::string sKeyId;       // JWK "kid"
  common::KeyType eType = common::KeyType::Jws;
  std::string sAlgorithm;   // JWS alg, or JWE key management alg
  std::string sEncryption;  // JWE "enc"; empty for JWS keys
  nlohmann::json jParameters = nlohmann::json::object();  // private JWK
  bool bRevoked = false;
  std::string sRevokedReason;
  std::chrono::system_clock::time_point tpCreatedAt;
  std::optional<std::chrono::system_clock::time_point> oExpiredAt;

  /// Wrap a freshly generated key. Creation time is now.
  static KeyMaterial create(common::KeyType eType, const JsonWebKey& jwkKey,
                            const std::string& sEncryption = {});

  /// True when created more than iDaysUntilExpire days before tpNow, or
  /// when oExpiredAt has passed.
  bool isExpired(int iDaysUntilExpire,
                 std::chrono::system_clock::time_point tpNow =
                     std::chrono::system_clock::now()) const;

  /// Mark revoked; oExpiredAt becomes now.
  void revoke(const std::string& sReason);

  JsonWebKey jsonWebKey() const;
  JsonWebKey publicJsonWebKey() const;
};

/// Timestamps are persisted as microseconds since the Unix epoch.
int64_t toEpochMicros(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point fromEpochMicros(int64_t iMicros);

void to_json(nlohmann::json& j, const KeyMaterial& km);
void from_json(const nlohmann::json& j, KeyMaterial& km);

}  // namespace jwks::security
