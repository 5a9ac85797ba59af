#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace certmon::dal {

class ConnectionPool;

/// RAII guard for checked-out database connections.
/// Returns the connection to the pool on destruction.
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
  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed-size pool of pqxx::connection objects shared by the reconciler
/// workers, the notifier and the API handlers.
/// Blocks on exhaustion up to the checkout timeout, then throws.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  /// Check out a connection. Blocks if all connections are in use.
  /// Stale connections are replaced transparently.
  ConnectionGuard checkout();

  /// Return a connection to the pool. Called by ConnectionGuard destructor.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  /// True if a pooled connection answers a trivial query.
  bool healthy();

  int size() const { return _iPoolSize; }

  /// Connections currently idle in the pool.
  int available();

 private:
  /// Validate a connection with a lightweight query.
  bool validate(pqxx::connection& conn);

  std::vector<std::shared_ptr<pqxx::connection>> _vAvailable;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace certmon::dal
