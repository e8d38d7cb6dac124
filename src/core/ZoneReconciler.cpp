#include "core/ZoneReconciler.hpp"

#include "common/DomainNames.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "core/Concurrent.hpp"
#include "core/DiffEngine.hpp"
#include "core/RateLimiter.hpp"
#include "providers/IProvider.hpp"

#include <array>
#include <utility>

namespace dnspub::core {

namespace {

// Provider reasons meaning "your read is stale", as opposed to a bad request.
constexpr std::array<const char*, 3> kRetryableReasons = {
    "preconditionFailed", "notFound", "alreadyExists"};

bool isRetryableReason(const std::string& sReason) {
  for (const char* pReason : kRetryableReasons) {
    if (sReason == pReason) return true;
  }
  return false;
}

}  // namespace

ZoneReconciler::ZoneReconciler(providers::IProvider& ipProvider, RateLimiter& rlLimiter,
                               int iNumThreads)
    : _ipProvider(ipProvider), _rlLimiter(rlLimiter), _iNumThreads(iNumThreads) {}

ZoneReconciler::~ZoneReconciler() = default;

ReconcileResult ZoneReconciler::reconcile(const std::string& sZone,
                                          const common::RecordSetMap& mDesired) {
  auto spLog = common::Logger::get();

  // Existing records for every name this batch touches.
  std::set<std::string> setDesiredNames;
  for (const auto& [sName, setRecords] : mDesired) {
    setDesiredNames.insert(sName);
  }
  auto mExisting = fetchRecords(sZone, setDesiredNames);

  // Glue for in-bailiwick nameservers currently delegated to. Their A/AAAA
  // must be diffed too, even when the batch did not name them.
  std::set<std::string> setGlueHosts;
  for (const auto& sHost : glueHostNames(mExisting)) {
    if (mExisting.find(sHost) == mExisting.end()) {
      setGlueHosts.insert(sHost);
    }
  }
  auto mGlue = fetchRecords(sZone, setGlueHosts);
  mExisting.merge(mGlue);

  std::set<common::ResourceRecord> setExisting;
  for (const auto& [sName, vRecords] : mExisting) {
    setExisting.insert(vRecords.begin(), vRecords.end());
  }
  const auto setDesired = DiffEngine::flatten(mDesired);

  ReconcileResult rr;
  rr.zdChange = DiffEngine::computeDiff(setDesired, setExisting);
  if (rr.zdChange.empty()) {
    spLog->info("{}: provider already matches desired state for {} names", sZone,
                mDesired.size());
    return rr;
  }

  submitChange(sZone, rr.zdChange);
  rr.bApplied = true;
  return rr;
}

std::set<std::string> ZoneReconciler::glueHostNames(
    const std::map<std::string, std::vector<common::ResourceRecord>>& mRecordsByName) {
  std::set<std::string> setHosts;
  for (const auto& [sOwner, vRecords] : mRecordsByName) {
    for (const auto& rr : vRecords) {
      if (rr.rtType != common::RecordType::NS) continue;
      for (const auto& sTarget : rr.setRrdata) {
        if (common::domain_names::isUnder(sTarget, sOwner)) {
          setHosts.insert(common::domain_names::toAbsolute(sTarget));
        }
      }
    }
  }
  return setHosts;
}

std::map<std::string, std::vector<common::ResourceRecord>> ZoneReconciler::fetchRecords(
    const std::string& sZone, const std::set<std::string>& setNames) {
  std::map<std::string, std::vector<common::ResourceRecord>> mOut;
  if (setNames.empty()) return mOut;

  common::Logger::get()->debug("{}: fetching records for {} names", sZone, setNames.size());

  const std::vector<std::string> vNames(setNames.begin(), setNames.end());
  auto vFetched = concurrentTransform(vNames, _iNumThreads, [this, &sZone](const std::string& sName) {
    _rlLimiter.acquire();
    return std::make_pair(sName, _ipProvider.listRecords(sZone, sName));
  });

  for (auto& [sName, vRecords] : vFetched) {
    mOut.emplace(std::move(sName), std::move(vRecords));
  }
  return mOut;
}

void ZoneReconciler::submitChange(const std::string& sZone, const common::ZoneDiff& zdChange) {
  auto spLog = common::Logger::get();
  spLog->info("{}: submitting change with {} additions and {} deletions", sZone,
              zdChange.setAdditions.size(), zdChange.setDeletions.size());
  spLog->debug("{}: change {}", sZone, nlohmann::json(zdChange).dump());

  _rlLimiter.acquire();
  try {
    _ipProvider.applyChange(sZone, zdChange);
  } catch (const common::ProviderChangeError& ex) {
    // More than one error means the request itself was wrong; give up.
    if (ex._vReasons.size() == 1 && isRetryableReason(ex._vReasons.front())) {
      throw common::ZoneStateError(ex._vReasons.front());
    }
    throw;
  }
}

}  // namespace dnspub::core
