#pragma once

#include <chrono>
#include <string>

#include "common/Types.hpp"
#include "core/ZoneReconciler.hpp"
#include "writers/BaseDnsWriter.hpp"
#include "writers/DesiredState.hpp"
#include "writers/RecordSetBuilder.hpp"

namespace dnspub::core {
class RateLimiter;
class Retrier;
}  // namespace dnspub::core

namespace dnspub::dal {
class IRegistryDataSource;
}

namespace dnspub::providers {
class IProvider;
}

namespace dnspub::writers {

/// Writer that reconciles one zone against an IProvider.
///
/// Staging only touches the registry; commit() runs the full read-diff-write
/// reconciliation under the retrier, re-reading the provider on every
/// stale-state conflict.
/// Class abbreviation: pdw
class ProviderDnsWriter : public BaseDnsWriter {
 public:
  ProviderDnsWriter(std::string sZone, providers::IProvider& ipProvider,
                    const dal::IRegistryDataSource& rdsRegistry, core::RateLimiter& rlLimiter,
                    int iNumThreads, const core::Retrier& rtRetrier, common::RecordTtls rtTtls,
                    std::chrono::system_clock::time_point tpReference);
  ~ProviderDnsWriter() override;

  const std::string& zone() const { return _sZone; }
  const DesiredState& desiredState() const { return _dstState; }

 protected:
  void publishDomainUnchecked(const std::string& sDomainName) override;
  void publishHostUnchecked(const std::string& sHostName) override;
  void commitUnchecked() override;

 private:
  std::string _sZone;
  const core::Retrier& _rtRetrier;
  core::ZoneReconciler _zrReconciler;
  RecordSetBuilder _rsbBuilder;
  DesiredState _dstState;
};

}  // namespace dnspub::writers
