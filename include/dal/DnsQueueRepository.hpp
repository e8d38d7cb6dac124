#pragma once

#include <string>

#include "dal/IDnsQueue.hpp"

namespace dnspub::dal {

class ConnectionPool;

/// Appends refresh requests to dns_refresh_requests for the batch dispatcher.
/// Class abbreviation: dqr
class DnsQueueRepository : public IDnsQueue {
 public:
  explicit DnsQueueRepository(ConnectionPool& cpPool);
  ~DnsQueueRepository() override;

  void addDomainRefreshTask(const std::string& sDomainName) override;
  void addHostRefreshTask(const std::string& sHostName) override;

 private:
  void insert(const char* pTargetType, const std::string& sTargetName);

  ConnectionPool& _cpPool;
};

}  // namespace dnspub::dal
