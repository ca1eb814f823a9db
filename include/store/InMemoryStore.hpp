#pragma once

#include <mutex>
#include <vector>

#include "store/IJsonWebKeyStore.hpp"

namespace jwks::store {

/// Process-local key store. Keys are lost on restart.
/// Class abbreviation: ims
class InMemoryStore : public IJsonWebKeyStore {
 public:
  void store(const security::KeyMaterial& km) override;
  std::optional<security::KeyMaterial> getCurrent(common::KeyType eType) override;
  std::vector<security::KeyMaterial> getLastKeys(
      int iQuantity, std::optional<common::KeyType> oType) override;
  std::optional<security::KeyMaterial> get(const std::string& sKeyId) override;
  void revoke(const std::string& sKeyId, const std::string& sReason) override;
  void clear() override;

 private:
  std::vector<security::KeyMaterial> newestFirst(std::optional<common::KeyType> oType) const;

  std::mutex _mtx;
  std::vector<security::KeyMaterial> _vKeys;  // insertion order
};

}  // namespace jwks::store
