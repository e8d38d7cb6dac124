#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dnspub::common {

/// Process-wide logger for the publisher, backed by spdlog's default logger
/// so it stays valid during static destruction.
/// Class abbreviation: N/A (static interface)
///
/// Messages about a batch are prefixed with the zone:
///   Logger::get()->info("{}: published domain {}", sTld, sDomain);
class Logger {
 public:
  /// Install the colored stdout logger at the given level. A second call only
  /// changes the level.
  static void init(const std::string& sLevel);

  /// Installs the logger at "info" on first use if init() was never called.
  static std::shared_ptr<spdlog::logger> get();

  /// "trace", "debug", "info", "warn" (or "warning"), "error", "critical", "off".
  /// Throws ValidationError for anything else.
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

 private:
  static bool _bInitialized;
};

}  // namespace dnspub::common
