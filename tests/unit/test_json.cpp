#include "common/Json.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace dnspub::common;

TEST(JsonTest, ResourceRecordWireShape) {
  ResourceRecord rr{"a.example.", RecordType::NS, 180, {"ns1.a.example.", "ns2.a.example."}};
  nlohmann::json j = rr;

  EXPECT_EQ(j["name"], "a.example.");
  EXPECT_EQ(j["type"], "NS");
  EXPECT_EQ(j["ttl"], 180);
  ASSERT_TRUE(j["rrdata"].is_array());
  EXPECT_EQ(j["rrdata"].size(), 2u);
}

TEST(JsonTest, ResourceRecordParsingCanonicalizesName) {
  auto j = nlohmann::json::parse(
      R"({"name": "NS1.A.Example", "type": "a", "ttl": 300, "rrdata": ["192.0.2.1"]})");
  auto rr = j.get<ResourceRecord>();

  EXPECT_EQ(rr.sName, "ns1.a.example.");
  EXPECT_EQ(rr.rtType, RecordType::A);
  EXPECT_EQ(rr.uTtl, 300u);
  EXPECT_EQ(rr.setRrdata, std::set<std::string>{"192.0.2.1"});
}

TEST(JsonTest, ResourceRecordRejectsUnsupportedType) {
  auto j = nlohmann::json::parse(R"({"name": "a.example", "type": "MX", "ttl": 300})");
  EXPECT_THROW(j.get<ResourceRecord>(), ValidationError);
}

TEST(JsonTest, ResourceRecordRejectsNegativeTtl) {
  auto j = nlohmann::json::parse(R"({"name": "a.example", "type": "A", "ttl": -1})");
  EXPECT_THROW(j.get<ResourceRecord>(), ValidationError);
}

TEST(JsonTest, ResourceRecordRejectsTtlAbove32Bits) {
  auto j = nlohmann::json::parse(R"({"name": "a.example", "type": "A", "ttl": 4294967296})");
  EXPECT_THROW(j.get<ResourceRecord>(), ValidationError);

  j["ttl"] = 4294967295LL;
  EXPECT_EQ(j.get<ResourceRecord>().uTtl, 4294967295u);
}

TEST(JsonTest, ZoneDiffHasBothSides) {
  ZoneDiff zd;
  zd.setAdditions.insert({"a.example.", RecordType::DS, 180, {"1 8 2 ABCD"}});
  nlohmann::json j = zd;

  EXPECT_EQ(j["additions"].size(), 1u);
  EXPECT_TRUE(j["deletions"].is_array());
  EXPECT_TRUE(j["deletions"].empty());
}

TEST(JsonTest, PublishBatchParses) {
  auto j = nlohmann::json::parse(R"({
    "tld": "example",
    "dnsWriter": "PowerDnsWriter",
    "domains": ["a.example", "b.example", "a.example"],
    "hosts": ["ns1.a.example"]
  })");
  auto pb = j.get<PublishBatch>();

  EXPECT_EQ(pb.sTld, "example");
  EXPECT_EQ(pb.sDnsWriter, "PowerDnsWriter");
  EXPECT_EQ(pb.setDomains.size(), 2u);
  EXPECT_EQ(pb.setHosts.size(), 1u);
}

TEST(JsonTest, PublishBatchListsAreOptional) {
  auto pb = nlohmann::json::parse(R"({"tld": "example", "dnsWriter": "VoidDnsWriter"})")
                .get<PublishBatch>();
  EXPECT_TRUE(pb.setDomains.empty());
  EXPECT_TRUE(pb.setHosts.empty());
}

TEST(JsonTest, PublishBatchRequiresTldAndWriter) {
  EXPECT_THROW(nlohmann::json::parse(R"({"dnsWriter": "w"})").get<PublishBatch>(),
               ValidationError);
  EXPECT_THROW(nlohmann::json::parse(R"({"tld": "example"})").get<PublishBatch>(),
               ValidationError);
  EXPECT_THROW(nlohmann::json::parse(R"({"tld": "", "dnsWriter": "w"})").get<PublishBatch>(),
               ValidationError);
}

TEST(JsonTest, PublishBatchRejectsWrongShapes) {
  EXPECT_THROW(nlohmann::json::parse(R"(["example"])").get<PublishBatch>(), ValidationError);
  EXPECT_THROW(
      nlohmann::json::parse(R"({"tld": "example", "dnsWriter": "w", "domains": "a.example"})")
          .get<PublishBatch>(),
      ValidationError);
  EXPECT_THROW(
      nlohmann::json::parse(R"({"tld": "example", "dnsWriter": "w", "hosts": [1]})")
          .get<PublishBatch>(),
      ValidationError);
}
