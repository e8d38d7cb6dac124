#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnspub::providers {

/// Pure abstract interface for DNS provider backends.
///
/// Reconciliation needs only two primitives: read the record sets at a name,
/// and apply an all-or-nothing change. applyChange() throws
/// common::ProviderChangeError carrying the provider's reasons when the
/// change is rejected ("notFound", "alreadyExists", "preconditionFailed", ...)
/// and common::ProviderError for transport or backend failures. A rejected
/// change must leave the zone untouched.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;
  virtual common::HealthStatus testConnectivity() = 0;

  /// Record sets stored at exactly sAbsoluteName in sZone.
  virtual std::vector<common::ResourceRecord> listRecords(const std::string& sZone,
                                                          const std::string& sAbsoluteName) = 0;

  /// Atomically delete zdChange.setDeletions and then add zdChange.setAdditions.
  virtual void applyChange(const std::string& sZone, const common::ZoneDiff& zdChange) = 0;
};

}  // namespace dnspub::providers
