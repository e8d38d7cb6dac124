#include "common/Types.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace dnspub::common {

std::string toString(RecordType rtType) {
  switch (rtType) {
    case RecordType::A: return "A";
    case RecordType::AAAA: return "AAAA";
    case RecordType::NS: return "NS";
    case RecordType::DS: return "DS";
  }
  return "UNKNOWN";
}

RecordType parseRecordType(const std::string& sType) {
  std::string sUpper = sType;
  std::transform(sUpper.begin(), sUpper.end(), sUpper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (sUpper == "A") return RecordType::A;
  if (sUpper == "AAAA") return RecordType::AAAA;
  if (sUpper == "NS") return RecordType::NS;
  if (sUpper == "DS") return RecordType::DS;
  throw ValidationError("unsupported_record_type", "Unsupported record type: " + sType);
}

std::string toString(HealthStatus hsStatus) {
  switch (hsStatus) {
    case HealthStatus::Ok: return "ok";
    case HealthStatus::Degraded: return "degraded";
    case HealthStatus::Unreachable: return "unreachable";
  }
  return "unknown";
}

std::string toString(PublishStatus psStatus) {
  return psStatus == PublishStatus::Accepted ? "ACCEPTED" : "REJECTED";
}

std::string toString(CommitStatus csStatus) {
  return csStatus == CommitStatus::Success ? "SUCCESS" : "FAILURE";
}

std::string DsData::toRrData() const {
  std::string sDigest = sDigestHex;
  std::transform(sDigest.begin(), sDigest.end(), sDigest.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return std::to_string(iKeyTag) + " " + std::to_string(iAlgorithm) + " " +
         std::to_string(iDigestType) + " " + sDigest;
}

bool DomainSnapshot::shouldPublishToDns() const {
  static const std::array<const char*, 4> kProhibited = {
      "clientHold", "serverHold", "inactive", "pendingDelete"};
  for (const auto& sStatus : vStatuses) {
    for (const char* pProhibited : kProhibited) {
      if (sStatus == pProhibited) return false;
    }
  }
  return true;
}

}  // namespace dnspub::common
