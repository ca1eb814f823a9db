#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace jwks::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() { release(); }

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

void ConnectionGuard::release() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
  _spConn.reset();
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be at least 1");
  }

  auto spLog = common::Logger::get();
  spLog->info("Opening {} key store connection(s) to {}", _iPoolSize, redactUrl(_sDbUrl));

  _vIdle.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vIdle.push_back(open());
  }
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vIdle.clear();
}

std::string ConnectionPool::redactUrl(const std::string& sDbUrl) {
  const auto nAt = sDbUrl.rfind('@');
  if (nAt == std::string::npos) return sDbUrl;
  const auto nScheme = sDbUrl.find("://");
  const std::string sScheme = nScheme == std::string::npos ? "" : sDbUrl.substr(0, nScheme + 3);
  return sScheme + "***" + sDbUrl.substr(nAt);
}

std::shared_ptr<pqxx::connection> ConnectionPool::open() const {
  try {
    auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    if (!spConn->is_open()) {
      throw common::KeyStoreError("db_unavailable", "Database connection is not open");
    }
    return spConn;
  } catch (const pqxx::broken_connection& e) {
    throw common::KeyStoreError("db_unavailable",
                                std::string("Cannot connect to key store database: ") + e.what());
  }
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);
  const bool bReady = _cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vIdle.empty(); });
  if (!bReady) {
    throw common::KeyStoreError("db_pool_exhausted",
                                "No database connection became free within " +
                                    std::to_string(_durCheckoutTimeout.count()) + "s");
  }

  auto spConn = std::move(_vIdle.back());
  _vIdle.pop_back();
  lock.unlock();

  if (!isAlive(*spConn)) {
    common::Logger::get()->warn("Dropping stale key store connection");
    try {
      spConn = open();
    } catch (const common::KeyStoreError&) {
      // Slot stays in the pool; the next checkout retries
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vIdle.push_back(std::move(spConn));
  }
  _cv.notify_one();
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vIdle.size());
}

bool ConnectionPool::isAlive(pqxx::connection& conn) {
  if (!conn.is_open()) return false;
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1");
    return true;
  } catch (const pqxx::broken_connection&) {
    return false;
  } catch (const pqxx::sql_error&) {
    return false;
  }
}

}  // namespace jwks::dal
