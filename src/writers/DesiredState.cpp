#include "writers/DesiredState.hpp"

#include "common/DomainNames.hpp"

#include <stdexcept>

namespace dnspub::writers {

DesiredState::DesiredState() = default;
DesiredState::~DesiredState() = default;

void DesiredState::stage(const std::string& sName, std::set<common::ResourceRecord> setRecords) {
  const std::string sAbsolute = common::domain_names::toAbsolute(sName);
  for (const auto& rr : setRecords) {
    if (rr.sName != sAbsolute) {
      throw std::invalid_argument("Record for " + rr.sName + " staged under " + sAbsolute);
    }
  }
  _mRecords.insert_or_assign(sAbsolute, std::move(setRecords));
}

bool DesiredState::contains(const std::string& sName) const {
  return _mRecords.count(common::domain_names::toAbsolute(sName)) > 0;
}

}  // namespace dnspub::writers
