#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnspub::providers {
class IProvider;
}

namespace dnspub::core {

class RateLimiter;

/// Outcome of one reconciliation pass.
/// Class abbreviation: rr
struct ReconcileResult {
  common::ZoneDiff zdChange;
  bool bApplied = false;  // false when desired already matched the provider
};

/// One read-diff-write pass of a zone against a provider.
///
/// Reads the current record sets for every desired name and for every
/// in-bailiwick nameserver those names delegate to, diffs the union against
/// the desired union, and submits at most one atomic change. Stateless
/// between calls, so a retry re-reads the provider from scratch.
/// Class abbreviation: zr
class ZoneReconciler {
 public:
  ZoneReconciler(providers::IProvider& ipProvider, RateLimiter& rlLimiter, int iNumThreads);
  ~ZoneReconciler();

  /// Throws common::ZoneStateError when the provider rejects the change
  /// because its state moved since it was read, common::ProviderError for
  /// any other failure.
  ReconcileResult reconcile(const std::string& sZone, const common::RecordSetMap& mDesired);

  /// Names of NS targets strictly below their owner name (absolute form).
  static std::set<std::string> glueHostNames(
      const std::map<std::string, std::vector<common::ResourceRecord>>& mRecordsByName);

 private:
  std::map<std::string, std::vector<common::ResourceRecord>> fetchRecords(
      const std::string& sZone, const std::set<std::string>& setNames);

  void submitChange(const std::string& sZone, const common::ZoneDiff& zdChange);

  providers::IProvider& _ipProvider;
  RateLimiter& _rlLimiter;
  int _iNumThreads;
};

}  // namespace dnspub::core
