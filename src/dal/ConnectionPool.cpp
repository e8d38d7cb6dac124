#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace dnspub::dal {

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

ConnectionPool::ConnectionPool(std::string sLabel, const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sLabel(std::move(sLabel)),
      _sDbUrl(sDbUrl),
      _iPoolSize(iPoolSize),
      _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool " + _sLabel + " needs at least one connection");
  }

  auto spLog = common::Logger::get();
  // Log only the part before credentials/host.
  spLog->info("Initializing {} connection pool: size={}, url={}", _sLabel, _iPoolSize,
              _sDbUrl.substr(0, _sDbUrl.find('@')));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    if (!spConn->is_open()) {
      throw std::runtime_error("Failed to open " + _sLabel + " database connection " +
                               std::to_string(i + 1));
    }
    _vAvailable.push_back(std::move(spConn));
  }

  spLog->info("{} connection pool ready: {} connections established", _sLabel, _iPoolSize);
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
    throw common::ServiceUnavailableError(
        "pool_exhausted", _sLabel + " connection pool exhausted: timeout waiting for connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale {} connection detected, reconnecting", _sLabel);
    try {
      spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    } catch (const pqxx::broken_connection&) {
      // Keep the slot: the stale connection goes back so the pool does not shrink.
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

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->debug("{} connection failed validation: {}", _sLabel, ex.what());
    return false;
  }
}

}  // namespace dnspub::dal
