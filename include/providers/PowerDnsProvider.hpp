#pragma once

#include <string>
#include <vector>

#include "providers/IProvider.hpp"

namespace dnspub::dal {
class ConnectionPool;
}

namespace dnspub::providers {

/// PowerDNS provider writing straight into the generic PostgreSQL backend
/// (gpgsql) tables `domains` and `records`.
///
/// Names and NS targets are stored without the trailing dot, as PowerDNS
/// expects. A change runs in one transaction holding the zone row lock, so
/// concurrent writers to the same zone serialize and a rejected change leaves
/// no trace.
/// Class abbreviation: pdp
class PowerDnsProvider : public IProvider {
 public:
  explicit PowerDnsProvider(dal::ConnectionPool& cpPool);
  ~PowerDnsProvider() override;

  std::string name() const override;
  common::HealthStatus testConnectivity() override;

  std::vector<common::ResourceRecord> listRecords(const std::string& sZone,
                                                  const std::string& sAbsoluteName) override;

  void applyChange(const std::string& sZone, const common::ZoneDiff& zdChange) override;

 private:
  dal::ConnectionPool& _cpPool;
};

}  // namespace dnspub::providers
