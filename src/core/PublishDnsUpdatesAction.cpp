#include "core/PublishDnsUpdatesAction.hpp"

#include "common/Clock.hpp"
#include "common/DomainNames.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/DnsMetrics.hpp"
#include "dal/IDnsQueue.hpp"
#include "dal/ILockHandler.hpp"
#include "writers/DnsWriterRegistry.hpp"
#include "writers/IDnsWriter.hpp"

#include <utility>

namespace dnspub::core {

PublishDnsUpdatesAction::PublishDnsUpdatesAction(dal::ILockHandler& ilhLocks,
                                                 const writers::DnsWriterRegistry& dwrRegistry,
                                                 dal::IDnsQueue& idqQueue,
                                                 IDnsMetrics& imMetrics,
                                                 const common::IClock& icClock,
                                                 std::chrono::seconds durLockTimeout)
    : _ilhLocks(ilhLocks),
      _dwrRegistry(dwrRegistry),
      _idqQueue(idqQueue),
      _imMetrics(imMetrics),
      _icClock(icClock),
      _durLockTimeout(durLockTimeout) {}

PublishDnsUpdatesAction::~PublishDnsUpdatesAction() = default;

void PublishDnsUpdatesAction::run(const common::PublishBatch& pbRequest) {
  // One lock and one metrics label per zone, whatever the caller's spelling.
  common::PublishBatch pbBatch = pbRequest;
  pbBatch.sTld = common::domain_names::canonicalize(pbRequest.sTld);

  const bool bRan = _ilhLocks.executeWithLocks([&] { processBatch(pbBatch); }, pbBatch.sTld,
                                               _durLockTimeout, kLockName);
  if (!bRan) {
    common::Logger::get()->error("Lock failure for zone {} ({} domain(s), {} host(s))",
                                 pbBatch.sTld, pbBatch.setDomains.size(),
                                 pbBatch.setHosts.size());
    throw common::ServiceUnavailableError("lock_failure", "Lock failure");
  }
}

void PublishDnsUpdatesAction::processBatch(const common::PublishBatch& pbBatch) {
  auto spLog = common::Logger::get();
  const auto tpStart = _icClock.now();

  auto upWriter = _dwrRegistry.getByNameForZone(pbBatch.sDnsWriter, pbBatch.sTld);
  if (!upWriter) {
    spLog->warn("Couldn't get writer {} for TLD {}; requeueing batch", pbBatch.sDnsWriter,
                pbBatch.sTld);
    requeueBatch(pbBatch);
    return;
  }

  auto [iDomainsPublished, iDomainsRejected] =
      publishNames(pbBatch.sTld, pbBatch.setDomains, false, *upWriter);
  auto [iHostsPublished, iHostsRejected] =
      publishNames(pbBatch.sTld, pbBatch.setHosts, true, *upWriter);

  _imMetrics.incrementPublishDomainRequests(pbBatch.sTld, iDomainsPublished,
                                            common::PublishStatus::Accepted);
  _imMetrics.incrementPublishDomainRequests(pbBatch.sTld, iDomainsRejected,
                                            common::PublishStatus::Rejected);
  _imMetrics.incrementPublishHostRequests(pbBatch.sTld, iHostsPublished,
                                          common::PublishStatus::Accepted);
  _imMetrics.incrementPublishHostRequests(pbBatch.sTld, iHostsRejected,
                                          common::PublishStatus::Rejected);

  CommitMetricsScope cmsScope(
      _imMetrics, _icClock, tpStart, pbBatch.sTld, pbBatch.sDnsWriter,
      {iDomainsPublished, iDomainsRejected, iHostsPublished, iHostsRejected});
  upWriter->commit();
  cmsScope.markSuccess();
}

std::pair<int, int> PublishDnsUpdatesAction::publishNames(const std::string& sZone,
                                                          const std::set<std::string>& setNames,
                                                          bool bHosts,
                                                          writers::IDnsWriter& idwWriter) {
  auto spLog = common::Logger::get();
  const char* pKind = bHosts ? "host" : "domain";
  int iPublished = 0;
  int iRejected = 0;

  for (const auto& sName : setNames) {
    if (!common::domain_names::isValid(sName) ||
        !common::domain_names::isUnder(sName, sZone)) {
      spLog->error("{}: skipping {} {} not under zone", sZone, pKind, sName);
      ++iRejected;
      continue;
    }
    spLog->info("{}: publishing {} {}", sZone, pKind, sName);
    if (bHosts) {
      idwWriter.publishHost(sName);
    } else {
      idwWriter.publishDomain(sName);
    }
    ++iPublished;
  }
  return {iPublished, iRejected};
}

void PublishDnsUpdatesAction::requeueBatch(const common::PublishBatch& pbBatch) {
  for (const auto& sDomain : pbBatch.setDomains) {
    _idqQueue.addDomainRefreshTask(sDomain);
  }
  for (const auto& sHost : pbBatch.setHosts) {
    _idqQueue.addHostRefreshTask(sHost);
  }
  common::Logger::get()->info("{}: requeued {} domain(s) and {} host(s)", pbBatch.sTld,
                               pbBatch.setDomains.size(), pbBatch.setHosts.size());
}

}  // namespace dnspub::core
