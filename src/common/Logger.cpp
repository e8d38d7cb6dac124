#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dnspub::common {

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  if (sLevel == "warning") return spdlog::level::warn;
  // from_str maps unknown names to "off".
  auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw ValidationError("invalid_log_level", "Unknown log level: " + sLevel);
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("dnspub");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->info("dns-publisher logging at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace dnspub::common
