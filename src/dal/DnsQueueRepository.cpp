#include "dal/DnsQueueRepository.hpp"

#include "common/DomainNames.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace dnspub::dal {

DnsQueueRepository::DnsQueueRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
DnsQueueRepository::~DnsQueueRepository() = default;

void DnsQueueRepository::addDomainRefreshTask(const std::string& sDomainName) {
  insert("DOMAIN", sDomainName);
}

void DnsQueueRepository::addHostRefreshTask(const std::string& sHostName) {
  insert("HOST", sHostName);
}

void DnsQueueRepository::insert(const char* pTargetType, const std::string& sTargetName) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO dns_refresh_requests (target_type, target_name, requested_time) "
      "VALUES ($1, $2, NOW())",
      pqxx::params{std::string(pTargetType), common::domain_names::canonicalize(sTargetName)});
  txn.commit();
}

}  // namespace dnspub::dal
