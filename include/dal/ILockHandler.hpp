#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace dnspub::dal {

/// Fleet-wide named mutex with an acquisition timeout.
class ILockHandler {
 public:
  virtual ~ILockHandler() = default;

  /// Run fnWork while holding the lock named (sLockName, sTld).
  /// Returns false without running fnWork if the lock was not acquired within
  /// durTimeout. Exceptions from fnWork propagate after the lock is released.
  virtual bool executeWithLocks(const std::function<void()>& fnWork, const std::string& sTld,
                                std::chrono::seconds durTimeout,
                                const std::string& sLockName) = 0;
};

}  // namespace dnspub::dal
