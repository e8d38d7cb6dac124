#pragma once

#include <chrono>
#include <mutex>

namespace dnspub::core {

/// Smooth token-bucket limiter. Permits are handed out at a fixed spacing of
/// 1/rate seconds; an idle limiter banks at most one second's worth.
/// acquire() blocks the calling thread and is the only backpressure against
/// the provider's QPS quota. Thread-safe; one instance is shared by every
/// writer of a backend.
/// Class abbreviation: rl
class RateLimiter {
 public:
  explicit RateLimiter(double dPermitsPerSecond);
  ~RateLimiter();

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  /// Block until iPermits are available. Returns the time spent waiting.
  std::chrono::microseconds acquire(int iPermits = 1);

  double rate() const { return _dPermitsPerSecond; }

 private:
  using Clock = std::chrono::steady_clock;

  /// Reserve permits and return the instant at which the caller may proceed.
  Clock::time_point reserve(int iPermits, Clock::time_point tpNow);

  /// Bank permits accrued since the last reservation.
  void resync(Clock::time_point tpNow);

  const double _dPermitsPerSecond;
  const double _dStableIntervalMicros;
  const double _dMaxStoredPermits;
  double _dStoredPermits = 0.0;
  Clock::time_point _tpNextFree;
  std::mutex _mtx;
};

}  // namespace dnspub::core
