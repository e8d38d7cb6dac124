#include "providers/PowerDnsProvider.hpp"

#include "common/DomainNames.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

#include <map>
#include <set>
#include <utility>

namespace dnspub::providers {

namespace {

/// rrdata as PowerDNS stores it: NS targets lose their trailing dot.
std::string toContent(common::RecordType rtType, const std::string& sRrdata) {
  if (rtType == common::RecordType::NS) {
    return common::domain_names::canonicalize(sRrdata);
  }
  return sRrdata;
}

std::string fromContent(common::RecordType rtType, const std::string& sContent) {
  if (rtType == common::RecordType::NS) {
    return common::domain_names::toAbsolute(sContent);
  }
  return sContent;
}

using TtlGroups = std::map<uint32_t, std::set<std::string>>;

/// Rows at (name, type) grouped by TTL.
TtlGroups selectRecordSet(pqxx::transaction_base& txn, int64_t iDomainId,
                          const std::string& sPdnsName, common::RecordType rtType) {
  TtlGroups mByTtl;
  for (const auto& row : txn.exec(
           "SELECT ttl, content FROM records "
           "WHERE domain_id = $1 AND name = $2 AND type = $3 AND NOT disabled",
           pqxx::params{iDomainId, sPdnsName, common::toString(rtType)})) {
    mByTtl[row[0].as<uint32_t>()].insert(fromContent(rtType, row[1].as<std::string>()));
  }
  return mByTtl;
}

}  // namespace

PowerDnsProvider::PowerDnsProvider(dal::ConnectionPool& cpPool) : _cpPool(cpPool) {}

PowerDnsProvider::~PowerDnsProvider() = default;

std::string PowerDnsProvider::name() const { return "powerdns"; }

common::HealthStatus PowerDnsProvider::testConnectivity() {
  try {
    auto cg = _cpPool.checkout();
    pqxx::nontransaction ntx(*cg);
    ntx.exec("SELECT 1").one_row();
    return common::HealthStatus::Ok;
  } catch (const std::exception& ex) {
    common::Logger::get()->warn("PowerDNS backend unreachable: {}", ex.what());
    return common::HealthStatus::Unreachable;
  }
}

std::vector<common::ResourceRecord> PowerDnsProvider::listRecords(
    const std::string& sZone, const std::string& sAbsoluteName) {
  const std::string sPdnsName = common::domain_names::canonicalize(sAbsoluteName);
  const std::string sAbsolute = common::domain_names::toAbsolute(sAbsoluteName);

  try {
    auto cg = _cpPool.checkout();
    pqxx::read_transaction txn(*cg);
    auto result = txn.exec(
        "SELECT r.type, r.ttl, r.content FROM records r JOIN domains d ON d.id = r.domain_id "
        "WHERE d.name = $1 AND r.name = $2 AND NOT r.disabled "
        "AND r.type IN ('A', 'AAAA', 'NS', 'DS') "
        "ORDER BY r.type, r.ttl",
        pqxx::params{common::domain_names::canonicalize(sZone), sPdnsName});
    txn.commit();

    std::map<std::pair<common::RecordType, uint32_t>, std::set<std::string>> mGrouped;
    for (const auto& row : result) {
      const auto rtType = common::parseRecordType(row[0].as<std::string>());
      mGrouped[{rtType, row[1].as<uint32_t>()}].insert(
          fromContent(rtType, row[2].as<std::string>()));
    }

    std::vector<common::ResourceRecord> vRecords;
    vRecords.reserve(mGrouped.size());
    for (auto& [key, setRrdata] : mGrouped) {
      vRecords.push_back({sAbsolute, key.first, key.second, std::move(setRrdata)});
    }
    return vRecords;
  } catch (const pqxx::failure& ex) {
    throw common::ProviderError("provider_backend_error",
                                "PowerDNS list failed for " + sAbsolute + ": " + ex.what());
  }
}

void PowerDnsProvider::applyChange(const std::string& sZone, const common::ZoneDiff& zdChange) {
  auto spLog = common::Logger::get();
  const std::string sPdnsZone = common::domain_names::canonicalize(sZone);

  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);

    auto zoneRow = txn.exec("SELECT id FROM domains WHERE name = $1 FOR UPDATE",
                            pqxx::params{sPdnsZone});
    if (zoneRow.empty()) {
      throw common::ProviderError("zone_not_found", "PowerDNS zone not found: " + sPdnsZone);
    }
    const auto iDomainId = zoneRow[0][0].as<int64_t>();

    // A stored RRset may span several TTLs; the deletions for one (name, type)
    // must together match every stored row.
    std::map<std::pair<std::string, common::RecordType>, TtlGroups> mDeletions;
    for (const auto& rr : zdChange.setDeletions) {
      auto& setRrdata =
          mDeletions[{common::domain_names::canonicalize(rr.sName), rr.rtType}][rr.uTtl];
      setRrdata.insert(rr.setRrdata.begin(), rr.setRrdata.end());
    }

    std::vector<std::string> vReasons;
    std::set<std::pair<std::string, common::RecordType>> setDeleted;

    for (const auto& [key, mExpected] : mDeletions) {
      const auto& [sPdnsName, rtType] = key;
      auto mByTtl = selectRecordSet(txn, iDomainId, sPdnsName, rtType);
      if (mByTtl.empty()) {
        spLog->debug("{}: deletion of {} {} not found", sPdnsZone, sPdnsName,
                     common::toString(rtType));
        vReasons.emplace_back("notFound");
      } else if (mByTtl != mExpected) {
        spLog->debug("{}: deletion of {} {} does not match stored set", sPdnsZone, sPdnsName,
                     common::toString(rtType));
        vReasons.emplace_back("preconditionFailed");
      } else {
        setDeleted.insert(key);
      }
    }

    for (const auto& rr : zdChange.setAdditions) {
      const std::string sPdnsName = common::domain_names::canonicalize(rr.sName);
      if (setDeleted.count({sPdnsName, rr.rtType}) > 0) continue;
      if (!selectRecordSet(txn, iDomainId, sPdnsName, rr.rtType).empty()) {
        spLog->debug("{}: addition of {} {} collides with stored set", sPdnsZone, rr.sName,
                     common::toString(rr.rtType));
        vReasons.emplace_back("alreadyExists");
      }
    }

    if (!vReasons.empty()) {
      txn.abort();
      throw common::ProviderChangeError(
          vReasons, "PowerDNS rejected change to " + sPdnsZone + " with " +
                        std::to_string(vReasons.size()) + " error(s), first: " + vReasons.front());
    }

    for (const auto& [sPdnsName, rtType] : setDeleted) {
      txn.exec("DELETE FROM records WHERE domain_id = $1 AND name = $2 AND type = $3",
               pqxx::params{iDomainId, sPdnsName, common::toString(rtType)});
    }

    for (const auto& rr : zdChange.setAdditions) {
      const std::string sPdnsName = common::domain_names::canonicalize(rr.sName);
      // DS is served by the parent with authority; delegation NS and glue are not.
      const bool bAuth = rr.rtType == common::RecordType::DS;
      for (const auto& sRrdata : rr.setRrdata) {
        txn.exec(
            "INSERT INTO records (domain_id, name, type, content, ttl, prio, disabled, auth) "
            "VALUES ($1, $2, $3, $4, $5, 0, false, $6)",
            pqxx::params{iDomainId, sPdnsName, common::toString(rr.rtType),
                         toContent(rr.rtType, sRrdata), static_cast<int64_t>(rr.uTtl), bAuth});
      }
    }

    txn.commit();
    spLog->debug("{}: applied {} deletion(s), {} addition(s)", sPdnsZone,
                 zdChange.setDeletions.size(), zdChange.setAdditions.size());
  } catch (const pqxx::failure& ex) {
    throw common::ProviderError("provider_backend_error",
                                "PowerDNS change failed for " + sPdnsZone + ": " + ex.what());
  }
}

}  // namespace dnspub::providers
