#pragma once

#include <optional>
#include <string>
#include <vector>

#include "security/CryptoService.hpp"
#include "store/IJsonWebKeyStore.hpp"

namespace pqxx {
class row;
}

namespace jwks::dal {

class ConnectionPool;

/// Keys in the security_keys table.
/// Private parameters are encrypted when pCrypto is non-null.
/// Class abbreviation: pks
class PostgresKeyStore : public store::IJsonWebKeyStore {
 public:
  explicit PostgresKeyStore(ConnectionPool& cpPool,
                            const security::CryptoService* pCrypto = nullptr);
  ~PostgresKeyStore() override;

  /// CREATE TABLE / INDEX IF NOT EXISTS. Safe to call on every startup.
  void ensureSchema();

  void store(const security::KeyMaterial& km) override;
  std::optional<security::KeyMaterial> getCurrent(common::KeyType eType) override;
  std::vector<security::KeyMaterial> getLastKeys(
      int iQuantity, std::optional<common::KeyType> oType) override;
  std::optional<security::KeyMaterial> get(const std::string& sKeyId) override;
  void revoke(const std::string& sKeyId, const std::string& sReason) override;
  void clear() override;

 private:
  security::KeyMaterial mapRow(const pqxx::row& row) const;

  ConnectionPool& _cpPool;
  const security::CryptoService* _pCrypto;
};

}  // namespace jwks::dal
