#include "core/DnsMetrics.hpp"

#include "common/Logger.hpp"

#include <algorithm>

namespace dnspub::core {

DnsMetrics::DnsMetrics() = default;
DnsMetrics::~DnsMetrics() = default;

void DnsMetrics::incrementPublishDomainRequests(const std::string& sTld, int64_t iCount,
                                                common::PublishStatus psStatus) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mDomainRequests[{sTld, psStatus}] += iCount;
}

void DnsMetrics::incrementPublishHostRequests(const std::string& sTld, int64_t iCount,
                                              common::PublishStatus psStatus) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mHostRequests[{sTld, psStatus}] += iCount;
}

void DnsMetrics::recordCommit(const std::string& sTld, const std::string& sDnsWriter,
                              common::CommitStatus csStatus,
                              std::chrono::milliseconds durElapsed, int iDomainsPublished,
                              int iHostsPublished) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto& csStats = _mCommits[{sTld, sDnsWriter, csStatus}];
  csStats.iCount += 1;
  csStats.iTotalDurationMs += durElapsed.count();
  csStats.iMaxDurationMs = std::max<int64_t>(csStats.iMaxDurationMs, durElapsed.count());
  csStats.iDomainsPublished += iDomainsPublished;
  csStats.iHostsPublished += iHostsPublished;
}

nlohmann::json DnsMetrics::snapshot() const {
  std::lock_guard<std::mutex> lock(_mtx);

  auto requestsToJson = [](const std::map<RequestKey, int64_t>& mCounters) {
    auto jOut = nlohmann::json::array();
    for (const auto& [key, iValue] : mCounters) {
      jOut.push_back({{"tld", key.first},
                      {"status", common::toString(key.second)},
                      {"count", iValue}});
    }
    return jOut;
  };

  nlohmann::json jCommits = nlohmann::json::array();
  for (const auto& [key, csStats] : _mCommits) {
    jCommits.push_back({{"tld", std::get<0>(key)},
                        {"dnsWriter", std::get<1>(key)},
                        {"status", common::toString(std::get<2>(key))},
                        {"count", csStats.iCount},
                        {"totalDurationMs", csStats.iTotalDurationMs},
                        {"maxDurationMs", csStats.iMaxDurationMs},
                        {"domainsPublished", csStats.iDomainsPublished},
                        {"hostsPublished", csStats.iHostsPublished}});
  }

  return {{"publishDomainRequests", requestsToJson(_mDomainRequests)},
          {"publishHostRequests", requestsToJson(_mHostRequests)},
          {"commits", jCommits}};
}

// ── CommitMetricsScope ─────────────────────────────────────────────────────

CommitMetricsScope::CommitMetricsScope(IDnsMetrics& imMetrics, const common::IClock& icClock,
                                       std::chrono::system_clock::time_point tpBatchStart,
                                       std::string sTld, std::string sDnsWriter,
                                       BatchCounts bcCounts)
    : _imMetrics(imMetrics),
      _icClock(icClock),
      _tpBatchStart(tpBatchStart),
      _sTld(std::move(sTld)),
      _sDnsWriter(std::move(sDnsWriter)),
      _bcCounts(bcCounts) {}

CommitMetricsScope::~CommitMetricsScope() {
  const auto durElapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(_icClock.now() - _tpBatchStart);
  auto spLog = common::Logger::get();
  try {
    _imMetrics.recordCommit(_sTld, _sDnsWriter, _csStatus, durElapsed,
                            _bcCounts.iDomainsPublished, _bcCounts.iHostsPublished);
  } catch (const std::exception& ex) {
    // Never let a metrics failure replace the commit's own outcome.
    spLog->error("{}: failed to record commit metrics: {}", _sTld, ex.what());
  }
  spLog->info(
      "writer.commit() statistics: TLD: {}, commitStatus: {}, duration: {}ms, "
      "domainsPublished: {}, domainsRejected: {}, hostsPublished: {}, hostsRejected: {}",
      _sTld, common::toString(_csStatus), durElapsed.count(), _bcCounts.iDomainsPublished,
      _bcCounts.iDomainsRejected, _bcCounts.iHostsPublished, _bcCounts.iHostsRejected);
}

}  // namespace dnspub::core
