#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace jwks::dal {

class ConnectionPool;

/// Hands a checked-out connection back to its pool when it goes out of scope.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  void release();

  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed set of libpqxx connections shared by the key store.
/// checkout() blocks until a connection frees up or the timeout passes.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  /// Throws KeyStoreError when no connection frees up in time or a stale
  /// connection cannot be reopened.
  ConnectionGuard checkout();

  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  int size() const { return _iPoolSize; }

  /// Connections currently idle.
  int available();

  /// Connection URL with the credentials part cut off, for logs.
  static std::string redactUrl(const std::string& sDbUrl);

 private:
  std::shared_ptr<pqxx::connection> open() const;
  static bool isAlive(pqxx::connection& conn);

  std::vector<std::shared_ptr<pqxx::connection>> _vIdle;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace jwks::dal
