#include "writers/RecordSetBuilder.hpp"

#include "common/Errors.hpp"
#include "fakes/FakeRegistryDataSource.hpp"
#include "writers/DesiredState.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace dnspub::common;
using dnspub::test::FakeRegistryDataSource;
using dnspub::writers::DesiredState;
using dnspub::writers::RecordSetBuilder;

namespace {

const std::chrono::system_clock::time_point kNow{std::chrono::hours(24 * 365 * 50)};

const ResourceRecord* findType(const std::set<ResourceRecord>& setRecords, RecordType rtType) {
  for (const auto& rr : setRecords) {
    if (rr.rtType == rtType) return &rr;
  }
  return nullptr;
}

}  // namespace

class RecordSetBuilderTest : public ::testing::Test {
 protected:
  void SetUp() override { _frds.addTld("example", {"PowerDnsWriter"}); }

  RecordSetBuilder makeBuilder(RecordTtls rtTtls = RecordTtls{}) {
    return RecordSetBuilder(_frds, rtTtls, kNow);
  }

  FakeRegistryDataSource _frds;
  DesiredState _dst;
};

TEST_F(RecordSetBuilderTest, MissingDomainStagesEmptySet) {
  makeBuilder().stageDomain("x.example", _dst);

  ASSERT_EQ(_dst.size(), 1u);
  EXPECT_TRUE(_dst.records().at("x.example.").empty());
}

TEST_F(RecordSetBuilderTest, HeldDomainStagesEmptySet) {
  _frds.addDomain({"a.example", {"serverHold"}, {}, {"ns1.x.net"}});
  makeBuilder().stageDomain("a.example", _dst);

  EXPECT_TRUE(_dst.records().at("a.example.").empty());
}

TEST_F(RecordSetBuilderTest, PendingDeleteDomainStagesEmptySet) {
  _frds.addDomain({"a.example", {"ok", "pendingDelete"}, {}, {"ns1.x.net"}});
  makeBuilder().stageDomain("a.example", _dst);

  EXPECT_TRUE(_dst.records().at("a.example.").empty());
}

TEST_F(RecordSetBuilderTest, StagesNsAndDsWithConfiguredTtls) {
  _frds.addDomain({"a.example",
                   {"ok"},
                   {DsData{12345, 8, 2, "abcdef01"}},
                   {"ns1.x.net", "NS2.X.NET."}});
  makeBuilder(RecordTtls{300, 3600, 86400}).stageDomain("a.example", _dst);

  const auto& setRecords = _dst.records().at("a.example.");
  ASSERT_EQ(setRecords.size(), 2u);

  const auto* pNs = findType(setRecords, RecordType::NS);
  ASSERT_NE(pNs, nullptr);
  EXPECT_EQ(pNs->uTtl, 3600u);
  EXPECT_EQ(pNs->setRrdata, (std::set<std::string>{"ns1.x.net.", "ns2.x.net."}));

  const auto* pDs = findType(setRecords, RecordType::DS);
  ASSERT_NE(pDs, nullptr);
  EXPECT_EQ(pDs->uTtl, 86400u);
  EXPECT_EQ(pDs->setRrdata, std::set<std::string>{"12345 8 2 ABCDEF01"});
}

TEST_F(RecordSetBuilderTest, DomainWithoutNameserversPublishesNoNs) {
  _frds.addDomain({"a.example", {}, {}, {}});
  makeBuilder().stageDomain("a.example", _dst);

  ASSERT_TRUE(_dst.contains("a.example."));
  EXPECT_TRUE(_dst.records().at("a.example.").empty());
}

TEST_F(RecordSetBuilderTest, StagesGlueForSubordinateNameserversOnly) {
  _frds.addDomain({"a.example", {}, {}, {"ns1.a.example", "ns1.x.net"}});
  _frds.addHost({"ns1.a.example", {"192.0.2.1", "2001:DB8::0:1"}});
  _frds.addHost({"ns1.x.net", {"198.51.100.1"}});
  makeBuilder(RecordTtls{300, 180, 180}).stageDomain("a.example", _dst);

  EXPECT_EQ(_dst.size(), 2u);
  EXPECT_FALSE(_dst.contains("ns1.x.net."));

  const auto& setGlue = _dst.records().at("ns1.a.example.");
  ASSERT_EQ(setGlue.size(), 2u);
  const auto* pA = findType(setGlue, RecordType::A);
  const auto* pAaaa = findType(setGlue, RecordType::AAAA);
  ASSERT_NE(pA, nullptr);
  ASSERT_NE(pAaaa, nullptr);
  EXPECT_EQ(pA->setRrdata, std::set<std::string>{"192.0.2.1"});
  EXPECT_EQ(pAaaa->setRrdata, std::set<std::string>{"2001:db8::1"});
  EXPECT_EQ(pA->uTtl, 300u);
}

TEST_F(RecordSetBuilderTest, DeletedSubordinateHostStagesEmptyGlue) {
  _frds.addDomain({"a.example", {}, {}, {"ns1.a.example"}});
  makeBuilder().stageDomain("a.example", _dst);

  ASSERT_TRUE(_dst.contains("ns1.a.example."));
  EXPECT_TRUE(_dst.records().at("ns1.a.example.").empty());
}

TEST_F(RecordSetBuilderTest, InvalidAddressIsAValidationError) {
  _frds.addDomain({"a.example", {}, {}, {"ns1.a.example"}});
  _frds.addHost({"ns1.a.example", {"not-an-address"}});

  EXPECT_THROW(makeBuilder().stageDomain("a.example", _dst), ValidationError);
}

TEST_F(RecordSetBuilderTest, LookupsUseReferenceInstant) {
  // Deleted one hour after the reference instant: still published.
  _frds.addDomain({"a.example", {}, {}, {"ns1.x.net"}}, {}, kNow + std::chrono::hours(1));
  // Created one hour after the reference instant: not yet visible.
  _frds.addDomain({"b.example", {}, {}, {"ns1.x.net"}}, kNow + std::chrono::hours(1));

  auto rsb = makeBuilder();
  rsb.stageDomain("a.example", _dst);
  rsb.stageDomain("b.example", _dst);

  EXPECT_EQ(_dst.records().at("a.example.").size(), 1u);
  EXPECT_TRUE(_dst.records().at("b.example.").empty());
  EXPECT_EQ(rsb.referenceTime(), kNow);
}

TEST_F(RecordSetBuilderTest, FindsSuperordinateDomainThroughTld) {
  auto rsb = makeBuilder();
  EXPECT_EQ(rsb.findSuperordinateDomain("ns1.a.example"), "a.example");
  EXPECT_EQ(rsb.findSuperordinateDomain("NS1.Deep.A.Example."), "a.example");
  EXPECT_FALSE(rsb.findSuperordinateDomain("ns1.a.other").has_value());
}
