#include "common/Json.hpp"

#include "common/DomainNames.hpp"
#include "common/Errors.hpp"

#include <cstdint>
#include <limits>

namespace dnspub::common {

namespace {

std::string requireString(const nlohmann::json& j, const char* pKey) {
  if (!j.contains(pKey) || !j[pKey].is_string() || j[pKey].get<std::string>().empty()) {
    throw ValidationError("missing_field", std::string("Missing or empty field: ") + pKey);
  }
  return j[pKey].get<std::string>();
}

std::set<std::string> optionalStringSet(const nlohmann::json& j, const char* pKey) {
  std::set<std::string> setOut;
  if (!j.contains(pKey) || j[pKey].is_null()) return setOut;
  if (!j[pKey].is_array()) {
    throw ValidationError("invalid_field", std::string("Field must be an array: ") + pKey);
  }
  for (const auto& jItem : j[pKey]) {
    if (!jItem.is_string()) {
      throw ValidationError("invalid_field",
                            std::string("Field must contain only strings: ") + pKey);
    }
    setOut.insert(jItem.get<std::string>());
  }
  return setOut;
}

}  // namespace

void to_json(nlohmann::json& j, const ResourceRecord& rr) {
  j = nlohmann::json{{"name", rr.sName},
                     {"type", toString(rr.rtType)},
                     {"ttl", rr.uTtl},
                     {"rrdata", rr.setRrdata}};
}

void from_json(const nlohmann::json& j, ResourceRecord& rr) {
  rr.sName = domain_names::toAbsolute(requireString(j, "name"));
  rr.rtType = parseRecordType(requireString(j, "type"));

  const auto iTtl = j.value("ttl", static_cast<int64_t>(0));
  if (iTtl < 0 || iTtl > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    throw ValidationError("invalid_ttl", "TTL out of range for " + rr.sName);
  }
  rr.uTtl = static_cast<uint32_t>(iTtl);
  rr.setRrdata = optionalStringSet(j, "rrdata");
}

void to_json(nlohmann::json& j, const ZoneDiff& zd) {
  j = nlohmann::json{{"additions", nlohmann::json::array()},
                     {"deletions", nlohmann::json::array()}};
  for (const auto& rr : zd.setAdditions) j["additions"].push_back(rr);
  for (const auto& rr : zd.setDeletions) j["deletions"].push_back(rr);
}

void from_json(const nlohmann::json& j, PublishBatch& pb) {
  if (!j.is_object()) {
    throw ValidationError("invalid_body", "Batch must be a JSON object");
  }
  pb.sTld = requireString(j, "tld");
  pb.sDnsWriter = requireString(j, "dnsWriter");
  pb.setDomains = optionalStringSet(j, "domains");
  pb.setHosts = optionalStringSet(j, "hosts");
}

void to_json(nlohmann::json& j, const PublishBatch& pb) {
  j = nlohmann::json{{"tld", pb.sTld},
                     {"dnsWriter", pb.sDnsWriter},
                     {"domains", pb.setDomains},
                     {"hosts", pb.setHosts}};
}

}  // namespace dnspub::common
