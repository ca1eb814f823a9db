#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/JwksOptions.hpp"
#include "core/JwksService.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/PostgresKeyStore.hpp"
#include "security/CryptoService.hpp"
#include "security/JwkService.hpp"
#include "store/FileSystemStore.hpp"
#include "store/IJsonWebKeyStore.hpp"
#include "store/InMemoryStore.hpp"

#include <openssl/crypto.h>

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = jwks::common::Config::load();

    jwks::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = jwks::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (store={}, jws={}, jwe={}/{})", cfgApp.sStore,
                cfgApp.sJwsAlgorithm, cfgApp.sJweAlgorithm, cfgApp.sJweEncryption);

    // ── Step 2: At-rest encryption of private key parameters ────────────
    std::unique_ptr<jwks::security::CryptoService> upCrypto;
    if (cfgApp.oMasterKey) {
      upCrypto = std::make_unique<jwks::security::CryptoService>(*cfgApp.oMasterKey);
      OPENSSL_cleanse(cfgApp.oMasterKey->data(), cfgApp.oMasterKey->size());
      cfgApp.oMasterKey.reset();
      spLog->info("Step 2: CryptoService initialized; private keys are encrypted at rest");
    } else if (cfgApp.sStore != "memory") {
      spLog->warn("Step 2: JWKS_MASTER_KEY not set; private keys are stored in plaintext");
    }

    // ── Step 3: Key store ────────────────────────────────────────────────
    std::unique_ptr<jwks::dal::ConnectionPool> upPool;
    std::unique_ptr<jwks::store::IJsonWebKeyStore> upStore;
    if (cfgApp.sStore == "postgres") {
      upPool = std::make_unique<jwks::dal::ConnectionPool>(*cfgApp.oDbUrl, cfgApp.iDbPoolSize);
      auto upPgStore = std::make_unique<jwks::dal::PostgresKeyStore>(*upPool, upCrypto.get());
      upPgStore->ensureSchema();
      upStore = std::move(upPgStore);
    } else if (cfgApp.sStore == "file") {
      upStore = std::make_unique<jwks::store::FileSystemStore>(cfgApp.sStorePath, upCrypto.get());
    } else {
      upStore = std::make_unique<jwks::store::InMemoryStore>();
    }
    spLog->info("Step 3: {} key store ready", cfgApp.sStore);

    // ── Step 4: Key services ─────────────────────────────────────────────
    jwks::security::JwkService jksService;
    auto joOptions = jwks::core::JwksOptions::fromConfig(cfgApp);
    jwks::core::JwksService jsService(*upStore, jksService, joOptions);
    spLog->info("Step 4: JwksService ready (keys expire after {} days, key prefix '{}')",
                joOptions.iDaysUntilExpire, joOptions.sKeyPrefix);

    // ── Step 5: Warm up current keys ─────────────────────────────────────
    const auto scSigning = jsService.getCurrentSigningCredentials();
    const auto ecEncrypting = jsService.getCurrentEncryptingCredentials();
    spLog->info("Step 5: Current keys: jws={} jwe={}", scSigning.sKid,
                ecEncrypting.jwkKey.keyId());

    // ── Step 6: Background rotation ──────────────────────────────────────
    jwks::core::MaintenanceScheduler msScheduler;
    msScheduler.schedule("key-rotation",
                         std::chrono::seconds(cfgApp.iRotationCheckIntervalSeconds),
                         [&jsService]() {
                           jsService.getCurrentSigningCredentials();
                           jsService.getCurrentEncryptingCredentials();
                         });
    msScheduler.start();
    spLog->info("Step 6: Key rotation check every {}s", cfgApp.iRotationCheckIntervalSeconds);

    // ── Step 7: HTTP server (blocks until SIGINT/SIGTERM) ────────────────
    jwks::api::ApiServer apiServer(jsService, cfgApp.sDiscoveryPath);
    apiServer.registerRoutes();
    spLog->info("Step 7: Publishing key set at {}", cfgApp.sDiscoveryPath);
    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    // Graceful shutdown
    msScheduler.stop();
    spLog->info("jwks-keyring stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] jwks-keyring failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
