#include "writers/ProviderDnsWriter.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/Retrier.hpp"

#include <utility>

namespace dnspub::writers {

ProviderDnsWriter::ProviderDnsWriter(std::string sZone, providers::IProvider& ipProvider,
                                     const dal::IRegistryDataSource& rdsRegistry,
                                     core::RateLimiter& rlLimiter, int iNumThreads,
                                     const core::Retrier& rtRetrier, common::RecordTtls rtTtls,
                                     std::chrono::system_clock::time_point tpReference)
    : _sZone(std::move(sZone)),
      _rtRetrier(rtRetrier),
      _zrReconciler(ipProvider, rlLimiter, iNumThreads),
      _rsbBuilder(rdsRegistry, rtTtls, tpReference) {}

ProviderDnsWriter::~ProviderDnsWriter() = default;

void ProviderDnsWriter::publishDomainUnchecked(const std::string& sDomainName) {
  _rsbBuilder.stageDomain(sDomainName, _dstState);
}

void ProviderDnsWriter::publishHostUnchecked(const std::string& sHostName) {
  auto oDomain = _rsbBuilder.findSuperordinateDomain(sHostName);
  if (!oDomain) {
    common::Logger::get()->error("Host {} is not under a managed TLD; not publishing",
                                 sHostName);
    return;
  }
  _rsbBuilder.stageDomain(*oDomain, _dstState);
}

void ProviderDnsWriter::commitUnchecked() {
  auto spLog = common::Logger::get();
  const common::RecordSetMap mDesired = _dstState.snapshot();
  spLog->info("Committing {} name(s) to zone {}", mDesired.size(), _sZone);

  try {
    auto rrResult = _rtRetrier.callWithRetry(
        [&] { return _zrReconciler.reconcile(_sZone, mDesired); },
        [](const std::exception& ex) {
          return dynamic_cast<const common::ZoneStateError*>(&ex) != nullptr;
        });
    if (rrResult.bApplied) {
      spLog->info("Zone {} updated: {} addition(s), {} deletion(s)", _sZone,
                  rrResult.zdChange.setAdditions.size(), rrResult.zdChange.setDeletions.size());
    }
  } catch (const common::ZoneStateError& ex) {
    throw common::ProviderError(
        "zone_state_retries_exhausted",
        "Gave up on zone " + _sZone + " after " + std::to_string(_rtRetrier.attempts()) +
            " attempt(s): " + ex.what());
  }
}

}  // namespace dnspub::writers
