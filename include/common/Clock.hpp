#pragma once

#include <chrono>

namespace dnspub::common {

/// Source of the current time. Injected so batch timing and the registry
/// reference instant are controllable in tests.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual std::chrono::system_clock::time_point now() const = 0;
};

/// Wall clock.
class SystemClock : public IClock {
 public:
  std::chrono::system_clock::time_point now() const override {
    return std::chrono::system_clock::now();
  }
};

}  // namespace dnspub::common
