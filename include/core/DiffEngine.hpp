#pragma once

#include <set>

#include "common/Types.hpp"

namespace dnspub::core {

/// Computes the minimal change that turns the observed provider state into
/// the desired state. Records present on both sides are dropped from both.
/// Class abbreviation: de
class DiffEngine {
 public:
  /// additions = desired - existing; deletions = existing - desired.
  static common::ZoneDiff computeDiff(const std::set<common::ResourceRecord>& setDesired,
                                      const std::set<common::ResourceRecord>& setExisting);

  /// Union of every value set in the map.
  static std::set<common::ResourceRecord> flatten(const common::RecordSetMap& mRecords);
};

}  // namespace dnspub::core
