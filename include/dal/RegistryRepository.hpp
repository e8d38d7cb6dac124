#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "dal/IRegistryDataSource.hpp"

namespace dnspub::dal {

class ConnectionPool;

/// Reads domains, hosts and TLDs from the registry database.
/// Tables: tlds, domains, domain_nameservers, domain_ds_data, hosts, host_addresses.
/// Class abbreviation: rgr
class RegistryRepository : public IRegistryDataSource {
 public:
  explicit RegistryRepository(ConnectionPool& cpPool);
  ~RegistryRepository() override;

  std::optional<common::DomainSnapshot> findDomain(
      const std::string& sDomainName, std::chrono::system_clock::time_point tpAt) const override;

  std::optional<common::HostSnapshot> findHost(
      const std::string& sHostName, std::chrono::system_clock::time_point tpAt) const override;

  std::optional<std::string> findTldForName(const std::string& sName) const override;

  std::optional<common::TldSnapshot> findTld(const std::string& sTld) const override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace dnspub::dal
