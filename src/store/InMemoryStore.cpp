#include "store/InMemoryStore.hpp"

#include "common/Errors.hpp"

#include <algorithm>

namespace jwks::store {

std::vector<security::KeyMaterial> InMemoryStore::newestFirst(
    std::optional<common::KeyType> oType) const {
  std::vector<security::KeyMaterial> vResult;
  for (auto it = _vKeys.rbegin(); it != _vKeys.rend(); ++it) {
    if (!oType || it->eType == *oType) {
      vResult.push_back(*it);
    }
  }
  std::stable_sort(vResult.begin(), vResult.end(),
                   [](const security::KeyMaterial& a, const security::KeyMaterial& b) {
                     return a.tpCreatedAt > b.tpCreatedAt;
                   });
  return vResult;
}

void InMemoryStore::store(const security::KeyMaterial& km) {
  std::lock_guard<std::mutex> lock(_mtx);
  const bool bExists = std::any_of(_vKeys.begin(), _vKeys.end(), [&](const auto& kmStored) {
    return kmStored.sKeyId == km.sKeyId;
  });
  if (bExists) {
    throw common::ConflictError("key_exists", "Key '" + km.sKeyId + "' is already stored");
  }
  _vKeys.push_back(km);
}

std::optional<security::KeyMaterial> InMemoryStore::getCurrent(common::KeyType eType) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto vKeys = newestFirst(eType);
  if (vKeys.empty()) return std::nullopt;
  return vKeys.front();
}

std::vector<security::KeyMaterial> InMemoryStore::getLastKeys(
    int iQuantity, std::optional<common::KeyType> oType) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto vKeys = newestFirst(oType);
  if (iQuantity < 0) iQuantity = 0;
  if (vKeys.size() > static_cast<size_t>(iQuantity)) {
    vKeys.resize(static_cast<size_t>(iQuantity));
  }
  return vKeys;
}

std::optional<security::KeyMaterial> InMemoryStore::get(const std::string& sKeyId) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = std::find_if(_vKeys.begin(), _vKeys.end(),
                         [&](const auto& km) { return km.sKeyId == sKeyId; });
  if (it == _vKeys.end()) return std::nullopt;
  return *it;
}

void InMemoryStore::revoke(const std::string& sKeyId, const std::string& sReason) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = std::find_if(_vKeys.begin(), _vKeys.end(),
                         [&](const auto& km) { return km.sKeyId == sKeyId; });
  if (it == _vKeys.end()) {
    throw common::NotFoundError("key_not_found", "Key '" + sKeyId + "' not found");
  }
  it->revoke(sReason);
}

void InMemoryStore::clear() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vKeys.clear();
}

}  // namespace jwks::store
