#include "api/routes/PublishRoutes.hpp"

#include "core/PublishDnsUpdatesAction.hpp"
#include "fakes/FakeCollaborators.hpp"
#include "fakes/FakeRegistryDataSource.hpp"
#include "security/TaskSignatureVerifier.hpp"
#include "writers/DnsWriterRegistry.hpp"
#include "writers/VoidDnsWriter.hpp"

#include <crow.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

using dnspub::api::routes::PublishRoutes;
using dnspub::core::PublishDnsUpdatesAction;
using dnspub::security::TaskSignatureVerifier;
using dnspub::test::FakeClock;
using dnspub::test::FakeDnsQueue;
using dnspub::test::FakeLockHandler;
using dnspub::test::FakeRegistryDataSource;
using dnspub::test::RecordingDnsMetrics;
using dnspub::writers::DnsWriterRegistry;
using dnspub::writers::VoidDnsWriter;

class PublishRoutesTest : public ::testing::Test {
 protected:
  PublishRoutesTest()
      : _tsvVerifier("route-test-secret"),
        _dwrRegistry(_frds),
        _pdaAction(_flhLocks, _dwrRegistry, _fdqQueue, _rdmMetrics, _fcClock,
                   std::chrono::seconds(5)),
        _prRoutes(_pdaAction, _tsvVerifier) {
    _frds.addTld("example", {VoidDnsWriter::kName});
    _dwrRegistry.registerWriter(VoidDnsWriter::kName, [](const std::string& sZone) {
      return std::make_unique<VoidDnsWriter>(sZone);
    });
  }

  crow::request makeRequest(const std::string& sBody, bool bSign = true) {
    crow::request req;
    req.body = sBody;
    if (bSign) req.add_header("X-Task-Signature", _tsvVerifier.sign(sBody));
    return req;
  }

  static std::string errorCode(const crow::response& resp) {
    return nlohmann::json::parse(resp.body).at("error").get<std::string>();
  }

  TaskSignatureVerifier _tsvVerifier;
  FakeRegistryDataSource _frds;
  DnsWriterRegistry _dwrRegistry;
  FakeLockHandler _flhLocks;
  FakeDnsQueue _fdqQueue;
  RecordingDnsMetrics _rdmMetrics;
  FakeClock _fcClock;
  PublishDnsUpdatesAction _pdaAction;
  PublishRoutes _prRoutes;
};

namespace {

const std::string kBody =
    R"({"tld":"example","dnsWriter":"VoidDnsWriter","domains":["a.example"],"hosts":[]})";

}  // namespace

TEST_F(PublishRoutesTest, SignedBatchIsPublished) {
  auto resp = _prRoutes.handlePublish(makeRequest(kBody));

  EXPECT_EQ(resp.code, 200);
  EXPECT_EQ(nlohmann::json::parse(resp.body).at("status"), "ok");
  ASSERT_EQ(_rdmMetrics.vCommits.size(), 1u);
  EXPECT_EQ(_rdmMetrics.vCommits[0].sDnsWriter, "VoidDnsWriter");
}

TEST_F(PublishRoutesTest, UnsignedRequestIsUnauthorized) {
  auto resp = _prRoutes.handlePublish(makeRequest(kBody, false));

  EXPECT_EQ(resp.code, 401);
  EXPECT_EQ(errorCode(resp), "missing_signature");
  EXPECT_TRUE(_flhLocks.vCalls.empty());
}

TEST_F(PublishRoutesTest, WrongSignatureIsUnauthorized) {
  auto req = makeRequest(kBody, false);
  req.add_header("X-Task-Signature", std::string(64, '0'));

  auto resp = _prRoutes.handlePublish(req);
  EXPECT_EQ(resp.code, 401);
  EXPECT_EQ(errorCode(resp), "invalid_signature");
}

TEST_F(PublishRoutesTest, MalformedJsonIsBadRequest) {
  auto resp = _prRoutes.handlePublish(makeRequest("{not json"));

  EXPECT_EQ(resp.code, 400);
  EXPECT_EQ(errorCode(resp), "invalid_json");
}

TEST_F(PublishRoutesTest, MissingFieldIsBadRequest) {
  auto resp = _prRoutes.handlePublish(makeRequest(R"({"dnsWriter":"VoidDnsWriter"})"));

  EXPECT_EQ(resp.code, 400);
  EXPECT_TRUE(_flhLocks.vCalls.empty());
}

TEST_F(PublishRoutesTest, LockFailureIsServiceUnavailable) {
  _flhLocks.bAvailable = false;
  auto resp = _prRoutes.handlePublish(makeRequest(kBody));

  EXPECT_EQ(resp.code, 503);
  EXPECT_EQ(errorCode(resp), "lock_failure");
}
