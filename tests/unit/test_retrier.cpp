#include "core/Retrier.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

using dnspub::common::ProviderError;
using dnspub::common::ZoneStateError;
using dnspub::core::Retrier;
using std::chrono::milliseconds;

namespace {

bool isZoneState(const std::exception& ex) {
  return dynamic_cast<const ZoneStateError*>(&ex) != nullptr;
}

}  // namespace

class RetrierTest : public ::testing::Test {
 protected:
  Retrier makeRetrier(int iAttempts, milliseconds durBase = milliseconds(100),
                      milliseconds durMax = milliseconds(1000)) {
    return Retrier(iAttempts, durBase, durMax,
                   [this](milliseconds dur) { _vSlept.push_back(dur); });
  }

  std::vector<milliseconds> _vSlept;
};

TEST_F(RetrierTest, RejectsZeroAttempts) {
  EXPECT_THROW(Retrier(0, milliseconds(1), milliseconds(1)), std::invalid_argument);
}

TEST_F(RetrierTest, ReturnsImmediatelyOnSuccess) {
  auto rt = makeRetrier(3);
  int iCalls = 0;
  int iResult = rt.callWithRetry([&] { ++iCalls; return 7; }, isZoneState);
  EXPECT_EQ(iResult, 7);
  EXPECT_EQ(iCalls, 1);
  EXPECT_TRUE(_vSlept.empty());
}

TEST_F(RetrierTest, RetriesRetryableUntilSuccess) {
  auto rt = makeRetrier(5);
  int iCalls = 0;
  rt.callWithRetry(
      [&] {
        if (++iCalls < 3) throw ZoneStateError("preconditionFailed");
      },
      isZoneState);
  EXPECT_EQ(iCalls, 3);
  EXPECT_EQ(_vSlept, (std::vector<milliseconds>{milliseconds(100), milliseconds(200)}));
}

TEST_F(RetrierTest, RethrowsLastErrorWhenAttemptsExhausted) {
  auto rt = makeRetrier(3);
  int iCalls = 0;
  EXPECT_THROW(rt.callWithRetry(
                   [&] {
                     ++iCalls;
                     throw ZoneStateError("notFound");
                   },
                   isZoneState),
               ZoneStateError);
  EXPECT_EQ(iCalls, 3);
  EXPECT_EQ(_vSlept.size(), 2u);
}

TEST_F(RetrierTest, NonRetryablePropagatesImmediately) {
  auto rt = makeRetrier(5);
  int iCalls = 0;
  EXPECT_THROW(rt.callWithRetry(
                   [&] {
                     ++iCalls;
                     throw ProviderError("provider_backend_error", "down");
                   },
                   isZoneState),
               ProviderError);
  EXPECT_EQ(iCalls, 1);
  EXPECT_TRUE(_vSlept.empty());
}

TEST_F(RetrierTest, BackoffDoublesAndCaps) {
  auto rt = makeRetrier(12, milliseconds(100), milliseconds(1000));
  EXPECT_EQ(rt.backoffFor(1), milliseconds(100));
  EXPECT_EQ(rt.backoffFor(2), milliseconds(200));
  EXPECT_EQ(rt.backoffFor(4), milliseconds(800));
  EXPECT_EQ(rt.backoffFor(5), milliseconds(1000));
  EXPECT_EQ(rt.backoffFor(60), milliseconds(1000));
}

TEST_F(RetrierTest, SingleAttemptNeverSleeps) {
  auto rt = makeRetrier(1);
  EXPECT_THROW(rt.callWithRetry([] { throw ZoneStateError("alreadyExists"); }, isZoneState),
               ZoneStateError);
  EXPECT_TRUE(_vSlept.empty());
  EXPECT_EQ(rt.attempts(), 1);
}
