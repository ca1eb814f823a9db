#include "security/KeyMaterial.hpp"

#include "common/Errors.hpp"
#include "security/CryptoService.hpp"

#include <cstdint>

namespace jwks::security {

int64_t toEpochMicros(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMicros(int64_t iMicros) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::microseconds(iMicros)));
}

KeyMaterial KeyMaterial::create(common::KeyType eType, const JsonWebKey& jwkKey,
                                const std::string& sEncryption) {
  KeyMaterial km;
  km.sId = CryptoService::generateUuid();
  km.sKeyId = jwkKey.keyId();
  km.eType = eType;
  km.sAlgorithm = jwkKey.algorithm();
  km.sEncryption = sEncryption;
  km.jParameters = jwkKey.json();
  // Truncated to microseconds; stores persist epoch microseconds
  km.tpCreatedAt = fromEpochMicros(toEpochMicros(std::chrono::system_clock::now()));
  return km;
}

bool KeyMaterial::isExpired(int iDaysUntilExpire,
                            std::chrono::system_clock::time_point tpNow) const {
  if (oExpiredAt.has_value() && *oExpiredAt <= tpNow) {
    return true;
  }
  // Whole-second age; no time_point arithmetic with the day count
  const int64_t iAgeSeconds =
      std::chrono::floor<std::chrono::seconds>(tpNow - tpCreatedAt).count();
  return iAgeSeconds > int64_t{iDaysUntilExpire} * 86400;
}

void KeyMaterial::revoke(const std::string& sReason) {
  bRevoked = true;
  sRevokedReason = sReason;
  oExpiredAt = fromEpochMicros(toEpochMicros(std::chrono::system_clock::now()));
}

JsonWebKey KeyMaterial::jsonWebKey() const { return JsonWebKey::fromJson(jParameters); }

JsonWebKey KeyMaterial::publicJsonWebKey() const { return jsonWebKey().toPublic(); }

void to_json(nlohmann::json& j, const KeyMaterial& km) {
  j = nlohmann::json{
      {"id", km.sId},
      {"kid", km.sKeyId},
      {"type", common::toString(km.eType)},
      {"alg", km.sAlgorithm},
      {"enc", km.sEncryption},
      {"parameters", km.jParameters},
      {"revoked", km.bRevoked},
      {"revoked_reason", km.sRevokedReason},
      {"created_at", toEpochMicros(km.tpCreatedAt)},
      {"expired_at", nullptr}};
  if (km.oExpiredAt.has_value()) {
    j["expired_at"] = toEpochMicros(*km.oExpiredAt);
  }
}

void from_json(const nlohmann::json& j, KeyMaterial& km) {
  try {
    km.sId = j.at("id").get<std::string>();
    km.sKeyId = j.at("kid").get<std::string>();
    km.eType = common::keyTypeFromString(j.at("type").get<std::string>());
    km.sAlgorithm = j.at("alg").get<std::string>();
    km.sEncryption = j.value("enc", std::string{});
    km.jParameters = j.at("parameters");
    km.bRevoked = j.value("revoked", false);
    km.sRevokedReason = j.value("revoked_reason", std::string{});
    km.tpCreatedAt = fromEpochMicros(j.at("created_at").get<int64_t>());
    km.oExpiredAt.reset();
    if (j.contains("expired_at") && !j["expired_at"].is_null()) {
      km.oExpiredAt = fromEpochMicros(j["expired_at"].get<int64_t>());
    }
  } catch (const nlohmann::json::exception& ex) {
    throw common::ValidationError("invalid_key_material",
                                  std::string("Malformed key material: ") + ex.what());
  }
}

}  // namespace jwks::security
