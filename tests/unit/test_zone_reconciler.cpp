#include "core/ZoneReconciler.hpp"

#include "common/Errors.hpp"
#include "core/RateLimiter.hpp"
#include "fakes/FakeProvider.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace dnspub::common;
using dnspub::core::RateLimiter;
using dnspub::core::ZoneReconciler;
using dnspub::test::FakeProvider;
using dnspub::test::makeRecord;

class ZoneReconcilerTest : public ::testing::Test {
 protected:
  ZoneReconcilerTest() : _rlLimiter(10000.0), _zrReconciler(_fpProvider, _rlLimiter, 4) {}

  bool wasListed(const std::string& sName) const {
    return std::find(_fpProvider.vListedNames.begin(), _fpProvider.vListedNames.end(), sName) !=
           _fpProvider.vListedNames.end();
  }

  FakeProvider _fpProvider;
  RateLimiter _rlLimiter;
  ZoneReconciler _zrReconciler;
};

TEST_F(ZoneReconcilerTest, AddsEverythingToEmptyZone) {
  RecordSetMap mDesired;
  mDesired["a.example."] = {makeRecord("a.example", RecordType::NS, 180, {"ns1.a.example."})};
  mDesired["ns1.a.example."] = {makeRecord("ns1.a.example", RecordType::A, 180, {"192.0.2.1"})};

  auto rr = _zrReconciler.reconcile("example", mDesired);

  EXPECT_TRUE(rr.bApplied);
  EXPECT_EQ(rr.zdChange.setAdditions.size(), 2u);
  EXPECT_TRUE(rr.zdChange.setDeletions.empty());
  EXPECT_EQ(_fpProvider.iApplyCalls, 1);
  EXPECT_EQ(_fpProvider.zoneRecords("example").size(), 2u);
}

TEST_F(ZoneReconcilerTest, MatchingZoneSubmitsNothing) {
  const auto rrNs = makeRecord("a.example", RecordType::NS, 180, {"ns1.x.net."});
  _fpProvider.seed("example", rrNs);

  RecordSetMap mDesired;
  mDesired["a.example."] = {rrNs};
  auto rr = _zrReconciler.reconcile("example", mDesired);

  EXPECT_FALSE(rr.bApplied);
  EXPECT_TRUE(rr.zdChange.empty());
  EXPECT_EQ(_fpProvider.iApplyCalls, 0);
}

TEST_F(ZoneReconcilerTest, RemovingDelegationAlsoRemovesExistingGlue) {
  _fpProvider.seed("example", makeRecord("a.example", RecordType::NS, 180, {"ns1.a.example."}));
  _fpProvider.seed("example", makeRecord("ns1.a.example", RecordType::A, 180, {"192.0.2.1"}));

  RecordSetMap mDesired;
  mDesired["a.example."] = {};
  auto rr = _zrReconciler.reconcile("example", mDesired);

  EXPECT_TRUE(wasListed("ns1.a.example."));
  EXPECT_TRUE(rr.zdChange.setAdditions.empty());
  EXPECT_EQ(rr.zdChange.setDeletions.size(), 2u);
  EXPECT_TRUE(_fpProvider.zoneRecords("example").empty());
}

TEST_F(ZoneReconcilerTest, OutOfBailiwickNameserversAreNotFetched) {
  _fpProvider.seed("example", makeRecord("a.example", RecordType::NS, 180, {"ns1.x.net."}));

  RecordSetMap mDesired;
  mDesired["a.example."] = {};
  _zrReconciler.reconcile("example", mDesired);

  EXPECT_FALSE(wasListed("ns1.x.net."));
  EXPECT_EQ(_fpProvider.iListCalls, 1);
}

TEST_F(ZoneReconcilerTest, SingleStaleReasonBecomesZoneStateError) {
  RecordSetMap mDesired;
  mDesired["a.example."] = {makeRecord("a.example", RecordType::NS, 180, {"ns1.x.net."})};
  _fpProvider.dqBeforeApply.push_back([this] {
    _fpProvider.seed("example", makeRecord("a.example", RecordType::NS, 180, {"ns9.x.net."}));
  });

  try {
    _zrReconciler.reconcile("example", mDesired);
    FAIL() << "expected ZoneStateError";
  } catch (const ZoneStateError& ex) {
    EXPECT_EQ(ex._sReason, "alreadyExists");
    EXPECT_EQ(ex._iHttpStatus, 409);
  }
}

TEST_F(ZoneReconcilerTest, MultipleReasonsAreNotRetryable) {
  RecordSetMap mDesired;
  mDesired["a.example."] = {makeRecord("a.example", RecordType::NS, 180, {"ns1.x.net."})};
  mDesired["b.example."] = {makeRecord("b.example", RecordType::NS, 180, {"ns1.x.net."})};
  _fpProvider.dqBeforeApply.push_back([this] {
    _fpProvider.seed("example", makeRecord("a.example", RecordType::NS, 180, {"ns9.x.net."}));
    _fpProvider.seed("example", makeRecord("b.example", RecordType::NS, 180, {"ns9.x.net."}));
  });

  EXPECT_THROW(_zrReconciler.reconcile("example", mDesired), ProviderChangeError);
}

TEST_F(ZoneReconcilerTest, UnknownReasonIsNotRetryable) {
  RecordSetMap mDesired;
  mDesired["a.example."] = {makeRecord("a.example", RecordType::NS, 180, {"ns1.x.net."})};
  _fpProvider.dqBeforeApply.push_back(
      [] { throw ProviderChangeError({"invalidTtl"}, "bad request"); });

  EXPECT_THROW(_zrReconciler.reconcile("example", mDesired), ProviderChangeError);
}

TEST(ZoneReconcilerGlueTest, GlueHostNamesKeepsSubordinateTargetsOnly) {
  std::map<std::string, std::vector<ResourceRecord>> mRecords;
  mRecords["a.example."] = {
      makeRecord("a.example", RecordType::NS, 180, {"ns1.a.example.", "ns.other.example."}),
      makeRecord("a.example", RecordType::DS, 180, {"1 8 2 AB"})};

  EXPECT_EQ(ZoneReconciler::glueHostNames(mRecords), std::set<std::string>{"ns1.a.example."});
}
