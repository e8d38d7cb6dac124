#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace dnspub::common {

/// Record types this service publishes. Anything else a provider holds is ignored.
enum class RecordType { A, AAAA, NS, DS };

/// Returns "A", "AAAA", "NS" or "DS".
std::string toString(RecordType rtType);

/// Parses a record type mnemonic (case-insensitive). Throws ValidationError.
RecordType parseRecordType(const std::string& sType);

/// One DNS resource record set: all rrdata for a (name, type) pair.
/// Compared structurally so it can be diffed as a set element.
/// Class abbreviation: rr
struct ResourceRecord {
  std::string sName;  // absolute, lower-case, trailing dot
  RecordType rtType = RecordType::A;
  uint32_t uTtl = 0;
  std::set<std::string> setRrdata;

  auto operator<=>(const ResourceRecord&) const = default;
};

/// Desired (or observed) record sets keyed by absolute name.
/// An empty set means "nothing may exist at this name".
using RecordSetMap = std::map<std::string, std::set<ResourceRecord>>;

/// Additions and deletions to apply atomically to one zone.
/// Class abbreviation: zd
struct ZoneDiff {
  std::set<ResourceRecord> setAdditions;
  std::set<ResourceRecord> setDeletions;

  bool empty() const { return setAdditions.empty() && setDeletions.empty(); }
};

/// Provider health status.
enum class HealthStatus { Ok, Degraded, Unreachable };

std::string toString(HealthStatus hsStatus);

/// Unit of work delivered by the task transport.
/// Class abbreviation: pb
struct PublishBatch {
  std::string sTld;
  std::string sDnsWriter;
  std::set<std::string> setDomains;
  std::set<std::string> setHosts;
};

enum class PublishStatus { Accepted, Rejected };
enum class CommitStatus { Success, Failure };

std::string toString(PublishStatus psStatus);
std::string toString(CommitStatus csStatus);

/// Per-record-type TTLs applied to everything a writer stages.
struct RecordTtls {
  uint32_t uATtl = 180;
  uint32_t uNsTtl = 180;
  uint32_t uDsTtl = 180;
};

// ── Registry projection ────────────────────────────────────────────────────

/// Delegation signer datum attached to a domain.
/// Class abbreviation: ds
struct DsData {
  int iKeyTag = 0;
  int iAlgorithm = 0;
  int iDigestType = 0;
  std::string sDigestHex;

  /// Presentation format: "<keyTag> <algorithm> <digestType> <DIGEST>".
  std::string toRrData() const;
};

/// Domain attributes relevant to DNS, as of a reference instant.
/// Class abbreviation: dsn
struct DomainSnapshot {
  std::string sName;
  std::vector<std::string> vStatuses;
  std::vector<DsData> vDsData;
  std::vector<std::string> vNameservers;

  /// False when any hold or pending-delete status is present.
  bool shouldPublishToDns() const;
};

/// Host attributes relevant to DNS, as of a reference instant.
/// Class abbreviation: hsn
struct HostSnapshot {
  std::string sName;
  std::vector<std::string> vInetAddresses;
};

/// TLD configuration relevant to DNS.
/// Class abbreviation: tsn
struct TldSnapshot {
  std::string sName;
  std::vector<std::string> vDnsWriters;
};

}  // namespace dnspub::common
