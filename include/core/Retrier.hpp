#pragma once

#include <chrono>
#include <exception>
#include <functional>

#include "common/Logger.hpp"

namespace dnspub::core {

/// Re-runs a whole operation while it fails with a retryable exception.
/// Backoff before attempt n+1 is base * 2^(n-1), capped at the maximum.
/// Class abbreviation: rt
class Retrier {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using RetryPredicate = std::function<bool(const std::exception&)>;

  /// fnSleeper defaults to std::this_thread::sleep_for.
  Retrier(int iAttempts, std::chrono::milliseconds durBaseDelay,
          std::chrono::milliseconds durMaxDelay, Sleeper fnSleeper = {});

  /// Call fn until it returns, throws a non-retryable exception, or the
  /// attempt bound is reached. The last exception is rethrown unchanged.
  template <typename F>
  auto callWithRetry(F&& fn, const RetryPredicate& fnIsRetryable) const -> decltype(fn());

  int attempts() const { return _iAttempts; }

  /// Delay slept after the given (1-based) failed attempt.
  std::chrono::milliseconds backoffFor(int iFailedAttempt) const;

 private:
  int _iAttempts;
  std::chrono::milliseconds _durBaseDelay;
  std::chrono::milliseconds _durMaxDelay;
  Sleeper _fnSleeper;
};

template <typename F>
auto Retrier::callWithRetry(F&& fn, const RetryPredicate& fnIsRetryable) const
    -> decltype(fn()) {
  for (int iAttempt = 1;; ++iAttempt) {
    try {
      return fn();
    } catch (const std::exception& ex) {
      if (iAttempt >= _iAttempts || !fnIsRetryable(ex)) {
        throw;
      }
      const auto durDelay = backoffFor(iAttempt);
      common::Logger::get()->warn("Attempt {}/{} failed, retrying in {}ms: {}", iAttempt,
                                  _iAttempts, durDelay.count(), ex.what());
      _fnSleeper(durDelay);
    }
  }
}

}  // namespace dnspub::core
