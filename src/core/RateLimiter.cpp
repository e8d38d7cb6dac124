#include "core/RateLimiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace dnspub::core {

RateLimiter::RateLimiter(double dPermitsPerSecond)
    : _dPermitsPerSecond(dPermitsPerSecond),
      _dStableIntervalMicros(dPermitsPerSecond > 0.0 ? 1'000'000.0 / dPermitsPerSecond : 0.0),
      _dMaxStoredPermits(dPermitsPerSecond),
      _tpNextFree(Clock::now()) {
  if (!(dPermitsPerSecond > 0.0)) {
    throw std::invalid_argument("RateLimiter: rate must be positive (got " +
                                std::to_string(dPermitsPerSecond) + ")");
  }
}

RateLimiter::~RateLimiter() = default;

void RateLimiter::resync(Clock::time_point tpNow) {
  if (tpNow <= _tpNextFree) return;

  const double dIdleMicros =
      static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(tpNow - _tpNextFree).count());
  _dStoredPermits = std::min(_dMaxStoredPermits, _dStoredPermits + dIdleMicros / _dStableIntervalMicros);
  _tpNextFree = tpNow;
}

RateLimiter::Clock::time_point RateLimiter::reserve(int iPermits, Clock::time_point tpNow) {
  resync(tpNow);
  const Clock::time_point tpReady = _tpNextFree;

  const double dFromStore = std::min(static_cast<double>(iPermits), _dStoredPermits);
  const double dFresh = static_cast<double>(iPermits) - dFromStore;
  const auto durWait = std::chrono::microseconds(static_cast<int64_t>(dFresh * _dStableIntervalMicros));

  _tpNextFree += durWait;
  _dStoredPermits -= dFromStore;
  return tpReady;
}

std::chrono::microseconds RateLimiter::acquire(int iPermits) {
  if (iPermits <= 0) {
    throw std::invalid_argument("RateLimiter: permits must be positive");
  }

  Clock::time_point tpNow;
  Clock::time_point tpReady;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    tpNow = Clock::now();
    tpReady = reserve(iPermits, tpNow);
  }

  if (tpReady <= tpNow) {
    return std::chrono::microseconds::zero();
  }
  std::this_thread::sleep_until(tpReady);
  return std::chrono::duration_cast<std::chrono::microseconds>(tpReady - tpNow);
}

}  // namespace dnspub::core
