#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace dnspub::dal {
class IRegistryDataSource;
}

namespace dnspub::writers {

class DesiredState;

/// Translates registry data into the record sets a writer stages.
///
/// All lookups are evaluated at the reference instant given at construction,
/// so staging the same names in any order yields the same DesiredState.
/// Class abbreviation: rsb
class RecordSetBuilder {
 public:
  RecordSetBuilder(const dal::IRegistryDataSource& rdsRegistry, common::RecordTtls rtTtls,
                   std::chrono::system_clock::time_point tpReference);
  ~RecordSetBuilder();

  /// Stage NS, DS and in-bailiwick glue for a domain, or an empty set when the
  /// domain is missing or must not be published.
  void stageDomain(const std::string& sDomainName, DesiredState& dstState) const;

  /// Stage A/AAAA for a host, or an empty set when the host is missing.
  /// Throws common::ValidationError for an address that is neither IPv4 nor IPv6.
  void stageSubordinateHost(const std::string& sHostName, DesiredState& dstState) const;

  /// The domain one label below the host's TLD, or nullopt when the host is
  /// not under any managed TLD.
  std::optional<std::string> findSuperordinateDomain(const std::string& sHostName) const;

  std::chrono::system_clock::time_point referenceTime() const { return _tpReference; }

 private:
  const dal::IRegistryDataSource& _rdsRegistry;
  common::RecordTtls _rtTtls;
  std::chrono::system_clock::time_point _tpReference;
};

}  // namespace dnspub::writers
