#pragma once

#include <string>

namespace dnspub::dal {

/// Producer side of the refresh queue: "recompute DNS for this name later".
class IDnsQueue {
 public:
  virtual ~IDnsQueue() = default;

  virtual void addDomainRefreshTask(const std::string& sDomainName) = 0;
  virtual void addHostRefreshTask(const std::string& sHostName) = 0;
};

}  // namespace dnspub::dal
