#include "dal/RegistryRepository.hpp"

#include "common/DomainNames.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dnspub::dal {

namespace {

int64_t toEpochMicros(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

// Existence window shared by domains and hosts; $2 is epoch microseconds.
constexpr const char* kExistsAt =
    "creation_time <= to_timestamp($2::bigint / 1000000.0) "
    "AND (deletion_time IS NULL OR deletion_time > to_timestamp($2::bigint / 1000000.0))";

}  // namespace

RegistryRepository::RegistryRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
RegistryRepository::~RegistryRepository() = default;

std::optional<common::DomainSnapshot> RegistryRepository::findDomain(
    const std::string& sDomainName, std::chrono::system_clock::time_point tpAt) const {
  const std::string sName = common::domain_names::canonicalize(sDomainName);
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);

  auto result = txn.exec(
      std::string("SELECT id FROM domains WHERE name = $1 AND ") + kExistsAt +
          " ORDER BY creation_time DESC LIMIT 1",
      pqxx::params{sName, toEpochMicros(tpAt)});
  if (result.empty()) return std::nullopt;

  const auto iId = result[0][0].as<int64_t>();
  common::DomainSnapshot dsn;
  dsn.sName = sName;

  for (const auto& row :
       txn.exec("SELECT unnest(statuses) FROM domains WHERE id = $1", pqxx::params{iId})) {
    dsn.vStatuses.push_back(row[0].as<std::string>());
  }

  for (const auto& row : txn.exec(
           "SELECT host_name FROM domain_nameservers WHERE domain_id = $1 ORDER BY host_name",
           pqxx::params{iId})) {
    dsn.vNameservers.push_back(common::domain_names::canonicalize(row[0].as<std::string>()));
  }

  for (const auto& row : txn.exec(
           "SELECT key_tag, algorithm, digest_type, encode(digest, 'hex') "
           "FROM domain_ds_data WHERE domain_id = $1 ORDER BY key_tag",
           pqxx::params{iId})) {
    common::DsData ds;
    ds.iKeyTag = row[0].as<int>();
    ds.iAlgorithm = row[1].as<int>();
    ds.iDigestType = row[2].as<int>();
    ds.sDigestHex = row[3].as<std::string>();
    dsn.vDsData.push_back(std::move(ds));
  }

  txn.commit();
  return dsn;
}

std::optional<common::HostSnapshot> RegistryRepository::findHost(
    const std::string& sHostName, std::chrono::system_clock::time_point tpAt) const {
  const std::string sName = common::domain_names::canonicalize(sHostName);
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);

  auto result = txn.exec(
      std::string("SELECT id FROM hosts WHERE name = $1 AND ") + kExistsAt +
          " ORDER BY creation_time DESC LIMIT 1",
      pqxx::params{sName, toEpochMicros(tpAt)});
  if (result.empty()) return std::nullopt;

  common::HostSnapshot hsn;
  hsn.sName = sName;
  for (const auto& row : txn.exec(
           "SELECT host(address) FROM host_addresses WHERE host_id = $1 ORDER BY address",
           pqxx::params{result[0][0].as<int64_t>()})) {
    hsn.vInetAddresses.push_back(row[0].as<std::string>());
  }

  txn.commit();
  return hsn;
}

std::optional<std::string> RegistryRepository::findTldForName(const std::string& sName) const {
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);
  auto result = txn.exec(
      "SELECT name FROM tlds "
      "WHERE length($1) > length(name) + 1 AND right($1, length(name) + 1) = '.' || name "
      "ORDER BY length(name) DESC LIMIT 1",
      pqxx::params{common::domain_names::canonicalize(sName)});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return result[0][0].as<std::string>();
}

std::optional<common::TldSnapshot> RegistryRepository::findTld(const std::string& sTld) const {
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);
  // One row per enabled writer; a single NULL row when the TLD has none.
  auto result = txn.exec(
      "SELECT w FROM tlds t LEFT JOIN LATERAL unnest(t.dns_writers) AS w ON true "
      "WHERE t.name = $1",
      pqxx::params{common::domain_names::canonicalize(sTld)});
  txn.commit();

  if (result.empty()) return std::nullopt;

  common::TldSnapshot tsn;
  tsn.sName = common::domain_names::canonicalize(sTld);
  for (const auto& row : result) {
    if (!row[0].is_null()) {
      tsn.vDnsWriters.push_back(row[0].as<std::string>());
    }
  }
  return tsn;
}

}  // namespace dnspub::dal
