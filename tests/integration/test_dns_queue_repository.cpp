#include "dal/DnsQueueRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using dnspub::dal::ConnectionPool;
using dnspub::dal::DnsQueueRepository;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("DNSPUB_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class DnsQueueRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "DNSPUB_DB_URL not set, skipping integration test";
    }
    _cpPool = std::make_unique<ConnectionPool>("registry", _sDbUrl, 2);
    _dqrRepo = std::make_unique<DnsQueueRepository>(*_cpPool);

    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM dns_refresh_requests");
    txn.commit();
  }

  std::vector<std::pair<std::string, std::string>> queued() {
    auto cg = _cpPool->checkout();
    pqxx::read_transaction txn(*cg);
    std::vector<std::pair<std::string, std::string>> vOut;
    for (const auto& row : txn.exec(
             "SELECT target_type, target_name FROM dns_refresh_requests ORDER BY id")) {
      vOut.emplace_back(row[0].as<std::string>(), row[1].as<std::string>());
    }
    txn.commit();
    return vOut;
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<DnsQueueRepository> _dqrRepo;
};

TEST_F(DnsQueueRepositoryTest, EnqueuesDomainsAndHostsInOrder) {
  _dqrRepo->addDomainRefreshTask("A.Example");
  _dqrRepo->addHostRefreshTask("ns1.a.example.");

  auto vRows = queued();
  ASSERT_EQ(vRows.size(), 2u);
  EXPECT_EQ(vRows[0], std::make_pair(std::string("DOMAIN"), std::string("a.example")));
  EXPECT_EQ(vRows[1], std::make_pair(std::string("HOST"), std::string("ns1.a.example")));
}

TEST_F(DnsQueueRepositoryTest, DuplicateRequestsAreKept) {
  _dqrRepo->addDomainRefreshTask("a.example");
  _dqrRepo->addDomainRefreshTask("a.example");

  EXPECT_EQ(queued().size(), 2u);
}
