#pragma once

#include <chrono>
#include <set>
#include <string>
#include <utility>

#include "common/Types.hpp"

namespace dnspub::common {
class IClock;
}

namespace dnspub::dal {
class IDnsQueue;
class ILockHandler;
}  // namespace dnspub::dal

namespace dnspub::writers {
class DnsWriterRegistry;
class IDnsWriter;
}  // namespace dnspub::writers

namespace dnspub::core {

class IDnsMetrics;

/// Publishes one batch of domain and host names to one zone's DNS.
///
/// Runs under the per-zone "DNS updates" lock: resolves the batch's writer,
/// stages every name that belongs to the zone, then commits once. A batch
/// whose writer is unavailable is requeued name by name instead of failing.
/// Class abbreviation: pda
class PublishDnsUpdatesAction {
 public:
  static constexpr const char* kLockName = "DNS updates";

  PublishDnsUpdatesAction(dal::ILockHandler& ilhLocks,
                          const writers::DnsWriterRegistry& dwrRegistry, dal::IDnsQueue& idqQueue,
                          IDnsMetrics& imMetrics, const common::IClock& icClock,
                          std::chrono::seconds durLockTimeout);
  ~PublishDnsUpdatesAction();

  /// The batch's TLD is canonicalized before it keys the lock or the metrics.
  /// Throws common::ServiceUnavailableError when the zone lock is not obtained.
  /// Errors from the writer's commit propagate after metrics are recorded.
  void run(const common::PublishBatch& pbRequest);

 private:
  void processBatch(const common::PublishBatch& pbBatch);
  void requeueBatch(const common::PublishBatch& pbBatch);

  /// Stages the names that belong to the zone, returns {published, rejected}.
  std::pair<int, int> publishNames(const std::string& sZone, const std::set<std::string>& setNames,
                                   bool bHosts, writers::IDnsWriter& idwWriter);

  dal::ILockHandler& _ilhLocks;
  const writers::DnsWriterRegistry& _dwrRegistry;
  dal::IDnsQueue& _idqQueue;
  IDnsMetrics& _imMetrics;
  const common::IClock& _icClock;
  std::chrono::seconds _durLockTimeout;
};

}  // namespace dnspub::core
