#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include <nlohmann/json.hpp>

#include "common/Clock.hpp"
#include "common/Types.hpp"

namespace dnspub::core {

/// Sink for publish-pipeline metrics.
class IDnsMetrics {
 public:
  virtual ~IDnsMetrics() = default;

  virtual void incrementPublishDomainRequests(const std::string& sTld, int64_t iCount,
                                              common::PublishStatus psStatus) = 0;
  virtual void incrementPublishHostRequests(const std::string& sTld, int64_t iCount,
                                            common::PublishStatus psStatus) = 0;
  virtual void recordCommit(const std::string& sTld, const std::string& sDnsWriter,
                            common::CommitStatus csStatus, std::chrono::milliseconds durElapsed,
                            int iDomainsPublished, int iHostsPublished) = 0;
};

/// In-process counters, exported as JSON on /metrics.
/// Class abbreviation: dm
class DnsMetrics : public IDnsMetrics {
 public:
  DnsMetrics();
  ~DnsMetrics() override;

  void incrementPublishDomainRequests(const std::string& sTld, int64_t iCount,
                                      common::PublishStatus psStatus) override;
  void incrementPublishHostRequests(const std::string& sTld, int64_t iCount,
                                    common::PublishStatus psStatus) override;
  void recordCommit(const std::string& sTld, const std::string& sDnsWriter,
                    common::CommitStatus csStatus, std::chrono::milliseconds durElapsed,
                    int iDomainsPublished, int iHostsPublished) override;

  /// {"publishDomainRequests": [...], "publishHostRequests": [...], "commits": [...]}
  nlohmann::json snapshot() const;

 private:
  struct CommitStats {
    int64_t iCount = 0;
    int64_t iTotalDurationMs = 0;
    int64_t iMaxDurationMs = 0;
    int64_t iDomainsPublished = 0;
    int64_t iHostsPublished = 0;
  };

  using RequestKey = std::pair<std::string, common::PublishStatus>;
  using CommitKey = std::tuple<std::string, std::string, common::CommitStatus>;

  mutable std::mutex _mtx;
  std::map<RequestKey, int64_t> _mDomainRequests;
  std::map<RequestKey, int64_t> _mHostRequests;
  std::map<CommitKey, CommitStats> _mCommits;
};

/// Records exactly one commit event for a batch when it goes out of scope.
/// The status stays FAILURE unless markSuccess() was called, so a commit that
/// throws is still reported before the exception reaches the caller.
/// Class abbreviation: cms
class CommitMetricsScope {
 public:
  struct BatchCounts {
    int iDomainsPublished = 0;
    int iDomainsRejected = 0;
    int iHostsPublished = 0;
    int iHostsRejected = 0;
  };

  CommitMetricsScope(IDnsMetrics& imMetrics, const common::IClock& icClock,
                     std::chrono::system_clock::time_point tpBatchStart, std::string sTld,
                     std::string sDnsWriter, BatchCounts bcCounts);
  ~CommitMetricsScope();

  CommitMetricsScope(const CommitMetricsScope&) = delete;
  CommitMetricsScope& operator=(const CommitMetricsScope&) = delete;

  void markSuccess() { _csStatus = common::CommitStatus::Success; }

 private:
  IDnsMetrics& _imMetrics;
  const common::IClock& _icClock;
  std::chrono::system_clock::time_point _tpBatchStart;
  std::string _sTld;
  std::string _sDnsWriter;
  BatchCounts _bcCounts;
  common::CommitStatus _csStatus = common::CommitStatus::Failure;
};

}  // namespace dnspub::core
