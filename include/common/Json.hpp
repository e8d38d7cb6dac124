#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace dnspub::common {

/// Wire shape: {"name", "type", "ttl", "rrdata": [..]}.
void to_json(nlohmann::json& j, const ResourceRecord& rr);

/// Throws ValidationError on an unknown type or a negative TTL.
void from_json(const nlohmann::json& j, ResourceRecord& rr);

/// {"additions": [..], "deletions": [..]}
void to_json(nlohmann::json& j, const ZoneDiff& zd);

/// Task body: {"tld", "dnsWriter", "domains": [..], "hosts": [..]}.
/// domains and hosts may be omitted. Throws ValidationError on missing tld/dnsWriter.
void from_json(const nlohmann::json& j, PublishBatch& pb);

void to_json(nlohmann::json& j, const PublishBatch& pb);

}  // namespace dnspub::common
