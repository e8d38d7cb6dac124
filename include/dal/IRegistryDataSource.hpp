#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace dnspub::dal {

/// Read-only view of registry data needed to compute DNS records.
/// Lookups take the instant to evaluate existence at, so one batch sees a
/// consistent picture regardless of the order names are published in.
class IRegistryDataSource {
 public:
  virtual ~IRegistryDataSource() = default;

  /// Domain as of tpAt, or nullopt if it did not exist then.
  virtual std::optional<common::DomainSnapshot> findDomain(
      const std::string& sDomainName, std::chrono::system_clock::time_point tpAt) const = 0;

  /// Host as of tpAt, or nullopt if it did not exist then.
  virtual std::optional<common::HostSnapshot> findHost(
      const std::string& sHostName, std::chrono::system_clock::time_point tpAt) const = 0;

  /// Longest managed TLD that sName is strictly under.
  virtual std::optional<std::string> findTldForName(const std::string& sName) const = 0;

  /// TLD configuration, or nullopt for an unknown TLD.
  virtual std::optional<common::TldSnapshot> findTld(const std::string& sTld) const = 0;
};

}  // namespace dnspub::dal
