#include "dal/PostgresKeyStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"
#include "store/SealedParameters.hpp"

#include <pqxx/pqxx>

#include <string>

namespace jwks::dal {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id::text, kid, key_type, algorithm, encryption, parameters, "
    "parameters_encrypted, is_revoked, revoked_reason, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_us, "
    "(EXTRACT(EPOCH FROM expired_at) * 1000000)::BIGINT AS expired_us "
    "FROM security_keys ";

constexpr const char* kNewestFirst = " ORDER BY created_at DESC, seq DESC";

[[noreturn]] void throwUnavailable(const std::string& sAction, const pqxx::failure& e) {
  throw common::KeyStoreError("store_unavailable", sAction + " failed: " + e.what());
}

}  // namespace

PostgresKeyStore::PostgresKeyStore(ConnectionPool& cpPool, const security::CryptoService* pCrypto)
    : _cpPool(cpPool), _pCrypto(pCrypto) {}
PostgresKeyStore::~PostgresKeyStore() = default;

void PostgresKeyStore::ensureSchema() {
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    txn.exec(
        "CREATE TABLE IF NOT EXISTS security_keys ("
        "  seq BIGSERIAL PRIMARY KEY,"
        "  id UUID NOT NULL UNIQUE,"
        "  kid TEXT NOT NULL UNIQUE,"
        "  key_type TEXT NOT NULL CHECK (key_type IN ('jws', 'jwe')),"
        "  algorithm TEXT NOT NULL,"
        "  encryption TEXT NOT NULL DEFAULT '',"
        "  parameters TEXT NOT NULL,"
        "  parameters_encrypted BOOLEAN NOT NULL DEFAULT FALSE,"
        "  is_revoked BOOLEAN NOT NULL DEFAULT FALSE,"
        "  revoked_reason TEXT NOT NULL DEFAULT '',"
        "  created_at TIMESTAMPTZ NOT NULL,"
        "  expired_at TIMESTAMPTZ"
        ")");
    txn.exec(
        "CREATE INDEX IF NOT EXISTS security_keys_type_created_idx "
        "ON security_keys (key_type, created_at DESC, seq DESC)");
    txn.commit();
  } catch (const pqxx::failure& e) {
    throwUnavailable("Creating security_keys schema", e);
  }
  common::Logger::get()->debug("security_keys schema ready");
}

security::KeyMaterial PostgresKeyStore::mapRow(const pqxx::row& row) const {
  security::KeyMaterial km;
  km.sId = row["id"].as<std::string>();
  km.sKeyId = row["kid"].as<std::string>();
  km.eType = common::keyTypeFromString(row["key_type"].as<std::string>());
  km.sAlgorithm = row["algorithm"].as<std::string>();
  km.sEncryption = row["encryption"].as<std::string>();

  store::SealedParameters sp;
  sp.sText = row["parameters"].as<std::string>();
  sp.bEncrypted = row["parameters_encrypted"].as<bool>();
  km.jParameters = sp.open(km.sKeyId, _pCrypto);

  km.bRevoked = row["is_revoked"].as<bool>();
  km.sRevokedReason = row["revoked_reason"].as<std::string>();
  km.tpCreatedAt = security::fromEpochMicros(row["created_us"].as<int64_t>());
  if (!row["expired_us"].is_null()) {
    km.oExpiredAt = security::fromEpochMicros(row["expired_us"].as<int64_t>());
  }
  return km;
}

void PostgresKeyStore::store(const security::KeyMaterial& km) {
  const auto sp = store::SealedParameters::seal(km, _pCrypto);
  std::optional<int64_t> oExpiredUs;
  if (km.oExpiredAt) oExpiredUs = security::toEpochMicros(*km.oExpiredAt);

  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    txn.exec(
        "INSERT INTO security_keys (id, kid, key_type, algorithm, encryption, parameters, "
        "parameters_encrypted, is_revoked, revoked_reason, created_at, expired_at) "
        "VALUES ($1::uuid, $2, $3, $4, $5, $6, $7, $8, $9, "
        "to_timestamp($10::double precision / 1000000), "
        "to_timestamp($11::double precision / 1000000))",
        pqxx::params{km.sId, km.sKeyId, common::toString(km.eType), km.sAlgorithm,
                     km.sEncryption, sp.sText, sp.bEncrypted, km.bRevoked, km.sRevokedReason,
                     security::toEpochMicros(km.tpCreatedAt), oExpiredUs});
    txn.commit();
  } catch (const pqxx::unique_violation&) {
    throw common::ConflictError("key_exists", "Key '" + km.sKeyId + "' is already stored");
  } catch (const pqxx::failure& e) {
    throw common::KeyStoreError("key_write_failed",
                                "Storing key '" + km.sKeyId + "' failed: " + e.what());
  }
}

std::optional<security::KeyMaterial> PostgresKeyStore::getCurrent(common::KeyType eType) {
  auto vKeys = getLastKeys(1, eType);
  if (vKeys.empty()) return std::nullopt;
  return std::move(vKeys.front());
}

std::vector<security::KeyMaterial> PostgresKeyStore::getLastKeys(
    int iQuantity, std::optional<common::KeyType> oType) {
  if (iQuantity <= 0) return {};
  std::optional<std::string> oTypeName;
  if (oType) oTypeName = common::toString(*oType);

  pqxx::result result;
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    result = txn.exec(std::string(kSelectColumns) +
                          "WHERE ($1::text IS NULL OR key_type = $1)" + kNewestFirst +
                          " LIMIT $2",
                      pqxx::params{oTypeName, iQuantity});
    txn.commit();
  } catch (const pqxx::failure& e) {
    throwUnavailable("Listing keys", e);
  }

  std::vector<security::KeyMaterial> vKeys;
  vKeys.reserve(result.size());
  for (const auto& row : result) {
    vKeys.push_back(mapRow(row));
  }
  return vKeys;
}

std::optional<security::KeyMaterial> PostgresKeyStore::get(const std::string& sKeyId) {
  pqxx::result result;
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    result = txn.exec(std::string(kSelectColumns) + "WHERE kid = $1", pqxx::params{sKeyId});
    txn.commit();
  } catch (const pqxx::failure& e) {
    throwUnavailable("Reading key '" + sKeyId + "'", e);
  }
  if (result.empty()) return std::nullopt;
  return mapRow(result[0]);
}

void PostgresKeyStore::revoke(const std::string& sKeyId, const std::string& sReason) {
  pqxx::result result;
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    result = txn.exec(
        "UPDATE security_keys SET is_revoked = TRUE, revoked_reason = $2, expired_at = NOW() "
        "WHERE kid = $1",
        pqxx::params{sKeyId, sReason});
    txn.commit();
  } catch (const pqxx::failure& e) {
    throwUnavailable("Revoking key '" + sKeyId + "'", e);
  }
  if (result.affected_rows() == 0) {
    throw common::NotFoundError("key_not_found", "Key '" + sKeyId + "' not found");
  }
}

void PostgresKeyStore::clear() {
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM security_keys");
    txn.commit();
  } catch (const pqxx::failure& e) {
    throwUnavailable("Clearing keys", e);
  }
}

}  // namespace jwks::dal
