#pragma once

#include <set>
#include <string>

#include "common/Types.hpp"

namespace dnspub::writers {

/// Per-batch accumulator of desired record sets, keyed by absolute name.
/// Staging a name again replaces what was staged for it before.
/// Owned by exactly one writer; not thread-safe.
/// Class abbreviation: dst
class DesiredState {
 public:
  DesiredState();
  ~DesiredState();

  /// Stage the full record set for sName (canonicalized to absolute form).
  /// An empty set stages deletion of everything at the name. Every record
  /// must be owned by sName; otherwise std::invalid_argument.
  void stage(const std::string& sName, std::set<common::ResourceRecord> setRecords);

  bool contains(const std::string& sName) const;
  size_t size() const { return _mRecords.size(); }
  bool empty() const { return _mRecords.empty(); }

  const common::RecordSetMap& records() const { return _mRecords; }

  /// Independent copy for a commit attempt.
  common::RecordSetMap snapshot() const { return _mRecords; }

 private:
  common::RecordSetMap _mRecords;
};

}  // namespace dnspub::writers
