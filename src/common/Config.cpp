#include "common/Config.hpp"

#include "security/Algorithm.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace jwks::common {

namespace {

// About a century
constexpr int kMaxDaysUntilExpire = 36500;

bool isFileNameSafe(const std::string& sValue) {
  return std::all_of(sValue.begin(), sValue.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
  });
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::optional<std::string> Config::loadOptionalSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

std::string Config::defaultKeyPrefix() {
  char vHost[HOST_NAME_MAX + 1] = {};
  if (gethostname(vHost, sizeof(vHost) - 1) != 0 || vHost[0] == '\0') {
    return "jwks_";
  }
  return std::string(vHost) + "_";
}

Config Config::load() {
  Config cfg;

  // ── Key store ──────────────────────────────────────────────────────────
  const std::string sStore = getEnv("JWKS_STORE");
  if (!sStore.empty()) {
    cfg.sStore = sStore;
  }
  const std::string sStorePath = getEnv("JWKS_STORE_PATH");
  if (!sStorePath.empty()) {
    cfg.sStorePath = sStorePath;
  }
  const std::string sDbUrl = getEnv("JWKS_DB_URL");
  if (!sDbUrl.empty()) {
    cfg.oDbUrl = sDbUrl;
  }
  cfg.iDbPoolSize = getEnvInt("JWKS_DB_POOL_SIZE", 4);

  cfg.oMasterKey = loadOptionalSecret("JWKS_MASTER_KEY");

  // ── Algorithms ─────────────────────────────────────────────────────────
  const std::string sJws = getEnv("JWKS_JWS_ALGORITHM");
  if (!sJws.empty()) {
    cfg.sJwsAlgorithm = sJws;
  }
  const std::string sJwe = getEnv("JWKS_JWE_ALGORITHM");
  if (!sJwe.empty()) {
    cfg.sJweAlgorithm = sJwe;
  }
  const std::string sEnc = getEnv("JWKS_JWE_ENCRYPTION");
  if (!sEnc.empty()) {
    cfg.sJweEncryption = sEnc;
  }

  // ── Rotation ───────────────────────────────────────────────────────────
  cfg.iDaysUntilExpire = getEnvInt("JWKS_DAYS_UNTIL_EXPIRE", 90);
  cfg.sKeyPrefix = getEnv("JWKS_KEY_PREFIX");
  if (cfg.sKeyPrefix.empty()) {
    cfg.sKeyPrefix = defaultKeyPrefix();
  }
  cfg.iAlgorithmsToKeep = getEnvInt("JWKS_ALGORITHMS_TO_KEEP", 2);
  cfg.iRotationCheckIntervalSeconds = getEnvInt("JWKS_ROTATION_CHECK_INTERVAL_SECONDS", 3600);

  // ── HTTP ───────────────────────────────────────────────────────────────
  cfg.iHttpPort = getEnvInt("JWKS_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("JWKS_HTTP_THREADS", 4);
  const std::string sPath = getEnv("JWKS_DISCOVERY_PATH");
  if (!sPath.empty()) {
    cfg.sDiscoveryPath = sPath;
  }

  // Logging
  const std::string sLogLevel = getEnv("JWKS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.sStore != "memory" && cfg.sStore != "file" && cfg.sStore != "postgres") {
    throw std::runtime_error(
        "JWKS_STORE must be one of memory, file, postgres (got '" + cfg.sStore + "')");
  }
  if (cfg.sStore == "postgres" && !cfg.oDbUrl.has_value()) {
    throw std::runtime_error("JWKS_DB_URL is required when JWKS_STORE=postgres");
  }
  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error(
        "JWKS_DB_POOL_SIZE must be >= 1 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }
  if (cfg.iDaysUntilExpire < 1 || cfg.iDaysUntilExpire > kMaxDaysUntilExpire) {
    throw std::runtime_error("JWKS_DAYS_UNTIL_EXPIRE must be between 1 and " +
                             std::to_string(kMaxDaysUntilExpire) + " (got " +
                             std::to_string(cfg.iDaysUntilExpire) + ")");
  }
  if (cfg.sStore == "file" && !isFileNameSafe(cfg.sKeyPrefix)) {
    throw std::runtime_error(
        "JWKS_KEY_PREFIX may only contain letters, digits, '-', '_' and '.' when "
        "JWKS_STORE=file (got '" + cfg.sKeyPrefix + "')");
  }
  if (cfg.iAlgorithmsToKeep < 1) {
    throw std::runtime_error(
        "JWKS_ALGORITHMS_TO_KEEP must be >= 1 (got " +
        std::to_string(cfg.iAlgorithmsToKeep) + ")");
  }
  if (cfg.iRotationCheckIntervalSeconds < 1) {
    throw std::runtime_error(
        "JWKS_ROTATION_CHECK_INTERVAL_SECONDS must be >= 1 (got " +
        std::to_string(cfg.iRotationCheckIntervalSeconds) + ")");
  }
  if (cfg.sDiscoveryPath.front() != '/') {
    throw std::runtime_error(
        "JWKS_DISCOVERY_PATH must start with '/' (got '" + cfg.sDiscoveryPath + "')");
  }

  // Unknown algorithm names fail here, not on first rotation
  try {
    (void)security::Algorithm::jws(cfg.sJwsAlgorithm);
    (void)security::Algorithm::jwe(cfg.sJweAlgorithm, cfg.sJweEncryption);
  } catch (const std::exception& ex) {
    throw std::runtime_error(std::string("Invalid algorithm configuration: ") + ex.what());
  }

  return cfg;
}

}  // namespace jwks::common
