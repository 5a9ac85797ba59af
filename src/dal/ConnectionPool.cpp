#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace certmon::dal {

namespace {

/// Strip credentials from a libpq URL before it reaches the log.
std::string redactUrl(const std::string& sDbUrl) {
  const auto uAt = sDbUrl.find('@');
  const auto uScheme = sDbUrl.find("://");
  if (uAt == std::string::npos || uScheme == std::string::npos || uScheme > uAt) {
    return sDbUrl;
  }
  return sDbUrl.substr(0, uScheme + 3) + "***" + sDbUrl.substr(uAt);
}

}  // namespace

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("ConnectionPool size must be >= 1");
  }

  auto spLog = common::Logger::get();
  spLog->info("Opening {} database connections to {}", _iPoolSize, redactUrl(_sDbUrl));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    if (!spConn->is_open()) {
      throw std::runtime_error("Failed to open database connection " + std::to_string(i + 1));
    }
    _vAvailable.push_back(std::move(spConn));
  }
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: no connection within " +
                             std::to_string(_durCheckoutTimeout.count()) + "s");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale database connection detected, reconnecting");
    try {
      spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    } catch (const std::exception&) {
      // Keep the slot: hand the dead connection back so the pool size holds
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

bool ConnectionPool::healthy() {
  try {
    auto cg = checkout();
    return validate(*cg);
  } catch (const std::exception& ex) {
    common::Logger::get()->warn("Database health check failed: {}", ex.what());
    return false;
  }
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vAvailable.size());
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace certmon::dal
