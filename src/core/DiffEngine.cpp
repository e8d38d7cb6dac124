#include "core/DiffEngine.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <iterator>

namespace dnspub::core {

common::ZoneDiff DiffEngine::computeDiff(const std::set<common::ResourceRecord>& setDesired,
                                         const std::set<common::ResourceRecord>& setExisting) {
  common::ZoneDiff zd;
  std::set_difference(setDesired.begin(), setDesired.end(), setExisting.begin(),
                      setExisting.end(), std::inserter(zd.setAdditions, zd.setAdditions.end()));
  std::set_difference(setExisting.begin(), setExisting.end(), setDesired.begin(),
                      setDesired.end(), std::inserter(zd.setDeletions, zd.setDeletions.end()));

  const size_t uCommon = setDesired.size() - zd.setAdditions.size();
  common::Logger::get()->debug(
      "There are {} common items out of the {} desired and {} existing records", uCommon,
      setDesired.size(), setExisting.size());
  return zd;
}

std::set<common::ResourceRecord> DiffEngine::flatten(const common::RecordSetMap& mRecords) {
  std::set<common::ResourceRecord> setOut;
  for (const auto& [sName, setRecords] : mRecords) {
    setOut.insert(setRecords.begin(), setRecords.end());
  }
  return setOut;
}

}  // namespace dnspub::core
