#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "security/CryptoService.hpp"
#include "store/IJsonWebKeyStore.hpp"

namespace jwks::store {

/// One "<kid>.key" JSON document per key under a directory.
/// Writes go to a temp file first and are renamed into place. A per-file
/// "sequence" records insertion order.
/// Private parameters are encrypted when pCrypto is non-null.
/// Class abbreviation: fss
class FileSystemStore : public IJsonWebKeyStore {
 public:
  /// Creates the directory when missing. Throws KeyStoreError on failure.
  explicit FileSystemStore(std::filesystem::path pathDir,
                           const security::CryptoService* pCrypto = nullptr);

  void store(const security::KeyMaterial& km) override;
  std::optional<security::KeyMaterial> getCurrent(common::KeyType eType) override;
  std::vector<security::KeyMaterial> getLastKeys(
      int iQuantity, std::optional<common::KeyType> oType) override;
  std::optional<security::KeyMaterial> get(const std::string& sKeyId) override;
  void revoke(const std::string& sKeyId, const std::string& sReason) override;
  void clear() override;

  const std::filesystem::path& directory() const { return _pathDir; }

 private:
  std::filesystem::path pathFor(const std::string& sKeyId) const;
  security::KeyMaterial readFile(const std::filesystem::path& pathFile,
                                 int64_t* pSequence = nullptr) const;
  void writeFile(const security::KeyMaterial& km, int64_t iSequence) const;

  /// Newest first. pMaxSequence receives the highest sequence on disk.
  std::vector<security::KeyMaterial> loadAll(std::optional<common::KeyType> oType,
                                             int64_t* pMaxSequence = nullptr) const;

  std::filesystem::path _pathDir;
  const security::CryptoService* _pCrypto;
  std::mutex _mtx;
};

}  // namespace jwks::store
