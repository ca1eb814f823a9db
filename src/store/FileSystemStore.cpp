#include "store/FileSystemStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "store/SealedParameters.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace jwks::store {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".key";

bool isSafeKeyId(const std::string& sKeyId) {
  if (sKeyId.empty() || sKeyId == "." || sKeyId == "..") return false;
  return std::all_of(sKeyId.begin(), sKeyId.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
  });
}

}  // namespace

FileSystemStore::FileSystemStore(fs::path pathDir, const security::CryptoService* pCrypto)
    : _pathDir(std::move(pathDir)), _pCrypto(pCrypto) {
  std::error_code ec;
  fs::create_directories(_pathDir, ec);
  if (ec) {
    throw common::KeyStoreError("store_unavailable",
                                "Cannot create key directory " + _pathDir.string() + ": " +
                                    ec.message());
  }
  common::Logger::get()->info("File key store at {} (parameters {})", _pathDir.string(),
                              _pCrypto ? "encrypted" : "plaintext");
}

fs::path FileSystemStore::pathFor(const std::string& sKeyId) const {
  if (!isSafeKeyId(sKeyId)) {
    throw common::ValidationError("invalid_key_id",
                                  "Key id '" + sKeyId + "' cannot be used as a file name");
  }
  return _pathDir / (sKeyId + kExtension);
}

// ── File I/O ───────────────────────────────────────────────────────────────

security::KeyMaterial FileSystemStore::readFile(const fs::path& pathFile,
                                                int64_t* pSequence) const {
  std::ifstream ifs(pathFile, std::ios::binary);
  if (!ifs) {
    throw common::KeyStoreError("key_unreadable", "Cannot open " + pathFile.string());
  }
  std::stringstream ss;
  ss << ifs.rdbuf();

  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(ss.str());
  } catch (const nlohmann::json::parse_error& e) {
    throw common::KeyStoreError("key_unreadable",
                                pathFile.string() + " is not valid JSON: " + e.what());
  }

  if (pSequence != nullptr) {
    *pSequence = jDoc.value("sequence", int64_t{0});
  }

  SealedParameters sp;
  sp.bEncrypted = jDoc.value("parameters_encrypted", false);
  if (sp.bEncrypted) {
    if (!jDoc.contains("parameters") || !jDoc["parameters"].is_string()) {
      throw common::KeyStoreError("key_unreadable",
                                  pathFile.string() + " has no encrypted parameters");
    }
    sp.sText = jDoc["parameters"].get<std::string>();
    jDoc["parameters"] = sp.open(jDoc.value("kid", std::string{}), _pCrypto);
  }

  try {
    return jDoc.get<security::KeyMaterial>();
  } catch (const common::ValidationError& e) {
    throw common::KeyStoreError("key_unreadable", pathFile.string() + ": " + e.what());
  }
}

void FileSystemStore::writeFile(const security::KeyMaterial& km, int64_t iSequence) const {
  nlohmann::json jDoc = km;
  jDoc["sequence"] = iSequence;
  if (_pCrypto != nullptr) {
    jDoc["parameters"] = SealedParameters::seal(km, _pCrypto).sText;
    jDoc["parameters_encrypted"] = true;
  }

  const fs::path pathFinal = pathFor(km.sKeyId);
  fs::path pathTemp = pathFinal;
  pathTemp += ".tmp";
  {
    std::ofstream ofs(pathTemp, std::ios::binary | std::ios::trunc);
    ofs << jDoc.dump(2);
    ofs.flush();
    if (!ofs) {
      throw common::KeyStoreError("key_write_failed", "Cannot write " + pathTemp.string());
    }
  }

  std::error_code ec;
  fs::permissions(pathTemp, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, ec);
  if (ec) {
    common::Logger::get()->warn("Cannot restrict permissions of {}: {}", pathTemp.string(),
                                ec.message());
  }
  fs::rename(pathTemp, pathFinal, ec);
  if (ec) {
    fs::remove(pathTemp, ec);
    throw common::KeyStoreError("key_write_failed",
                                "Cannot move key file into place: " + pathFinal.string());
  }
}

std::vector<security::KeyMaterial> FileSystemStore::loadAll(
    std::optional<common::KeyType> oType, int64_t* pMaxSequence) const {
  std::vector<std::pair<int64_t, security::KeyMaterial>> vEntries;
  int64_t iMaxSequence = 0;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(_pathDir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != kExtension) continue;
    int64_t iSequence = 0;
    auto km = readFile(entry.path(), &iSequence);
    iMaxSequence = std::max(iMaxSequence, iSequence);
    if (!oType || km.eType == *oType) {
      vEntries.emplace_back(iSequence, std::move(km));
    }
  }
  if (ec) {
    throw common::KeyStoreError("store_unavailable",
                                "Cannot list " + _pathDir.string() + ": " + ec.message());
  }
  if (pMaxSequence != nullptr) *pMaxSequence = iMaxSequence;

  std::sort(vEntries.begin(), vEntries.end(), [](const auto& a, const auto& b) {
    if (a.second.tpCreatedAt != b.second.tpCreatedAt) {
      return a.second.tpCreatedAt > b.second.tpCreatedAt;
    }
    return a.first > b.first;
  });

  std::vector<security::KeyMaterial> vKeys;
  vKeys.reserve(vEntries.size());
  for (auto& pr : vEntries) {
    vKeys.push_back(std::move(pr.second));
  }
  return vKeys;
}

// ── IJsonWebKeyStore ───────────────────────────────────────────────────────

void FileSystemStore::store(const security::KeyMaterial& km) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (fs::exists(pathFor(km.sKeyId))) {
    throw common::ConflictError("key_exists", "Key '" + km.sKeyId + "' is already stored");
  }
  int64_t iMaxSequence = 0;
  loadAll(std::nullopt, &iMaxSequence);
  writeFile(km, iMaxSequence + 1);
}

std::optional<security::KeyMaterial> FileSystemStore::getCurrent(common::KeyType eType) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto vKeys = loadAll(eType);
  if (vKeys.empty()) return std::nullopt;
  return vKeys.front();
}

std::vector<security::KeyMaterial> FileSystemStore::getLastKeys(
    int iQuantity, std::optional<common::KeyType> oType) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto vKeys = loadAll(oType);
  const size_t nKeep = iQuantity < 0 ? 0 : static_cast<size_t>(iQuantity);
  if (vKeys.size() > nKeep) vKeys.resize(nKeep);
  return vKeys;
}

std::optional<security::KeyMaterial> FileSystemStore::get(const std::string& sKeyId) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!isSafeKeyId(sKeyId)) return std::nullopt;
  const auto pathFile = pathFor(sKeyId);
  if (!fs::exists(pathFile)) return std::nullopt;
  return readFile(pathFile);
}

void FileSystemStore::revoke(const std::string& sKeyId, const std::string& sReason) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!isSafeKeyId(sKeyId) || !fs::exists(pathFor(sKeyId))) {
    throw common::NotFoundError("key_not_found", "Key '" + sKeyId + "' not found");
  }
  int64_t iSequence = 0;
  auto km = readFile(pathFor(sKeyId), &iSequence);
  km.revoke(sReason);
  writeFile(km, iSequence);
}

void FileSystemStore::clear() {
  std::lock_guard<std::mutex> lock(_mtx);
  std::error_code ec;
  std::vector<fs::path> vFiles;
  for (const auto& entry : fs::directory_iterator(_pathDir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == kExtension) {
      vFiles.push_back(entry.path());
    }
  }
  for (const auto& pathFile : vFiles) {
    if (!fs::remove(pathFile, ec) || ec) {
      throw common::KeyStoreError("key_write_failed", "Cannot remove " + pathFile.string());
    }
  }
}

}  // namespace jwks::store
