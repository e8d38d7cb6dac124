#include "core/Retrier.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace dnspub::core {

Retrier::Retrier(int iAttempts, std::chrono::milliseconds durBaseDelay,
                 std::chrono::milliseconds durMaxDelay, Sleeper fnSleeper)
    : _iAttempts(iAttempts),
      _durBaseDelay(durBaseDelay),
      _durMaxDelay(durMaxDelay),
      _fnSleeper(std::move(fnSleeper)) {
  if (_iAttempts < 1) {
    throw std::invalid_argument("Retrier: attempts must be >= 1");
  }
  if (!_fnSleeper) {
    _fnSleeper = [](std::chrono::milliseconds dur) { std::this_thread::sleep_for(dur); };
  }
}

std::chrono::milliseconds Retrier::backoffFor(int iFailedAttempt) const {
  // Shift capped well below overflow; the max delay clamps the result anyway.
  const int iShift = std::clamp(iFailedAttempt - 1, 0, 20);
  const std::chrono::milliseconds durDelay = _durBaseDelay * (int64_t{1} << iShift);
  return std::min(durDelay, _durMaxDelay);
}

}  // namespace dnspub::core
