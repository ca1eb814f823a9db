#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "security/KeyMaterial.hpp"

namespace jwks::store {

/// Pure abstract interface for key persistence.
/// "Newest" means latest tpCreatedAt; keys created in the same instant are
/// ordered by insertion.
class IJsonWebKeyStore {
 public:
  virtual ~IJsonWebKeyStore() = default;

  /// Throws ConflictError when the kid is already stored.
  virtual void store(const security::KeyMaterial& km) = 0;

  /// Newest key of eType, revoked or not.
  virtual std::optional<security::KeyMaterial> getCurrent(common::KeyType eType) = 0;

  /// Newest first, at most iQuantity keys. All types when oType is empty.
  virtual std::vector<security::KeyMaterial> getLastKeys(
      int iQuantity, std::optional<common::KeyType> oType) = 0;

  virtual std::optional<security::KeyMaterial> get(const std::string& sKeyId) = 0;

  /// Throws NotFoundError for an unknown kid.
  virtual void revoke(const std::string& sKeyId, const std::string& sReason) = 0;

  virtual void clear() = 0;
};

}  // namespace jwks::store
