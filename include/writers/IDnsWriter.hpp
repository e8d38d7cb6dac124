#pragma once

#include <string>

namespace dnspub::writers {

/// Stage-then-commit interface for publishing one batch to one DNS backend.
///
/// publishDomain()/publishHost() only stage desired state in memory; commit()
/// pushes everything staged in a single reconciliation. An instance serves
/// exactly one batch: publishing after commit(), or committing twice, throws
/// std::logic_error.
class IDnsWriter {
 public:
  virtual ~IDnsWriter() = default;

  /// Stage the records of a domain (NS, DS and subordinate-host glue), or its
  /// removal if it no longer exists or must not be published.
  virtual void publishDomain(const std::string& sDomainName) = 0;

  /// Stage a host by re-staging its superordinate domain.
  virtual void publishHost(const std::string& sHostName) = 0;

  /// Push all staged state. Throws on failure.
  virtual void commit() = 0;
};

}  // namespace dnspub::writers
