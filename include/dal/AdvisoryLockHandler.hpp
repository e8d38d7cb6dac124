#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "dal/ILockHandler.hpp"

namespace dnspub::dal {

class ConnectionPool;

/// Fleet-wide lock built on PostgreSQL session advisory locks.
///
/// The lock key is hashtextextended("<lock name>:<tld>", 0). A pooled
/// connection is held for the whole critical section; acquisition is bounded
/// by lock_timeout on that session, so waiting never spins.
/// Class abbreviation: alh
class AdvisoryLockHandler : public ILockHandler {
 public:
  explicit AdvisoryLockHandler(ConnectionPool& cpPool);
  ~AdvisoryLockHandler() override;

  bool executeWithLocks(const std::function<void()>& fnWork, const std::string& sTld,
                        std::chrono::seconds durTimeout, const std::string& sLockName) override;

  static std::string lockKey(const std::string& sLockName, const std::string& sTld);

 private:
  ConnectionPool& _cpPool;
};

}  // namespace dnspub::dal
