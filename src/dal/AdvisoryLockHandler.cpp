#include "dal/AdvisoryLockHandler.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

#include <chrono>
#include <string>
#include <utility>

namespace dnspub::dal {

namespace {

// SQLSTATE lock_not_available, raised when lock_timeout expires.
constexpr const char* kLockNotAvailable = "55P03";

/// Bounds lock waits on the session and clears the bound when the
/// acquisition attempt ends on any path.
class LockTimeoutScope {
 public:
  LockTimeoutScope(pqxx::connection& conn, std::chrono::seconds durTimeout) : _conn(conn) {
    pqxx::nontransaction ntx(_conn);
    ntx.exec("SET lock_timeout = '" + std::to_string(durTimeout.count() * 1000) + "ms'");
  }

  ~LockTimeoutScope() {
    try {
      pqxx::nontransaction ntx(_conn);
      ntx.exec("RESET lock_timeout");
    } catch (const pqxx::failure& ex) {
      // A closed session cannot leak its settings back into the pool.
      common::Logger::get()->error("Failed to reset lock_timeout, closing session: {}",
                                   ex.what());
      _conn.close();
    }
  }

  LockTimeoutScope(const LockTimeoutScope&) = delete;
  LockTimeoutScope& operator=(const LockTimeoutScope&) = delete;

 private:
  pqxx::connection& _conn;
};

/// Releases the advisory lock when the critical section ends, however it ends.
class AdvisoryLockRelease {
 public:
  AdvisoryLockRelease(pqxx::connection& conn, std::string sKey)
      : _conn(conn), _sKey(std::move(sKey)) {}

  ~AdvisoryLockRelease() {
    try {
      pqxx::nontransaction ntx(_conn);
      ntx.exec("SELECT pg_advisory_unlock(hashtextextended($1, 0))", pqxx::params{_sKey});
    } catch (const pqxx::failure& ex) {
      // Session locks die with the session; closing it is the fallback.
      common::Logger::get()->error("Failed to release lock '{}', closing session: {}", _sKey,
                                   ex.what());
      _conn.close();
    }
  }

  AdvisoryLockRelease(const AdvisoryLockRelease&) = delete;
  AdvisoryLockRelease& operator=(const AdvisoryLockRelease&) = delete;

 private:
  pqxx::connection& _conn;
  std::string _sKey;
};

}  // namespace

AdvisoryLockHandler::AdvisoryLockHandler(ConnectionPool& cpPool) : _cpPool(cpPool) {}
AdvisoryLockHandler::~AdvisoryLockHandler() = default;

std::string AdvisoryLockHandler::lockKey(const std::string& sLockName, const std::string& sTld) {
  return sLockName + ":" + sTld;
}

bool AdvisoryLockHandler::executeWithLocks(const std::function<void()>& fnWork,
                                           const std::string& sTld,
                                           std::chrono::seconds durTimeout,
                                           const std::string& sLockName) {
  auto spLog = common::Logger::get();
  const std::string sKey = lockKey(sLockName, sTld);
  auto cg = _cpPool.checkout();

  bool bAcquired = true;
  {
    LockTimeoutScope ltsTimeout(*cg, durTimeout);
    pqxx::nontransaction ntx(*cg);
    try {
      ntx.exec("SELECT pg_advisory_lock(hashtextextended($1, 0))", pqxx::params{sKey});
    } catch (const pqxx::sql_error& ex) {
      if (ex.sqlstate() != kLockNotAvailable) {
        throw;
      }
      bAcquired = false;
    }
  }

  if (!bAcquired) {
    spLog->warn("Timed out after {}s waiting for lock '{}'", durTimeout.count(), sKey);
    return false;
  }

  spLog->debug("Acquired lock '{}'", sKey);
  AdvisoryLockRelease alrRelease(*cg, sKey);
  fnWork();
  return true;
}

}  // namespace dnspub::dal
