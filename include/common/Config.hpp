#pragma once

#include <optional>
#include <string>

namespace jwks::common {

/// Environment variable loader for the key service.
/// Loads all JWKS_* vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Key store ─────────────────────────────────────────────────────────
  std::string sStore = "memory";  // memory | file | postgres
  std::string sStorePath = "/var/lib/jwks-keyring/keys";
  std::optional<std::string> oDbUrl;
  int iDbPoolSize = 4;

  // ── At-rest protection ────────────────────────────────────────────────
  std::optional<std::string> oMasterKey;  // raw hex string (zeroed after handoff to CryptoService)

  // ── Algorithms ────────────────────────────────────────────────────────
  std::string sJwsAlgorithm = "ES256";
  std::string sJweAlgorithm = "RSA-OAEP";
  std::string sJweEncryption = "A128CBC-HS256";

  // ── Rotation ──────────────────────────────────────────────────────────
  int iDaysUntilExpire = 90;
  std::string sKeyPrefix;  // defaults to "<hostname>_"
  int iAlgorithmsToKeep = 2;
  int iRotationCheckIntervalSeconds = 3600;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;
  std::string sDiscoveryPath = "/jwks";

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for JWKS_MASTER_KEY.
  /// Throws on invalid constraints.
  static Config load();

  /// "<hostname>_", or "jwks_" when the hostname cannot be read.
  static std::string defaultKeyPrefix();

 private:
  /// Read an optional secret env var with _FILE fallback.
  /// If neither varName nor varName + "_FILE" is set, returns nullopt.
  /// Trims trailing whitespace/newlines from file contents.
  static std::optional<std::string> loadOptionalSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace jwks::common
