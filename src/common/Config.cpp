#include "common/Config.hpp"

#include "common/Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dnspub::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t uParsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &uParsed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (uParsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

void Config::requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMin) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("DNSPUB_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable DNSPUB_DB_URL is not set");
  }
  cfg.sPdnsDbUrl = loadSecret("DNSPUB_PDNS_DB_URL");
  cfg.sTaskSecret = loadSecret("DNSPUB_TASK_SECRET");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("DNSPUB_DB_POOL_SIZE", 10);
  cfg.iPdnsDbPoolSize = getEnvInt("DNSPUB_PDNS_DB_POOL_SIZE", 4);
  cfg.iHttpPort = getEnvInt("DNSPUB_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("DNSPUB_HTTP_THREADS", 4);

  const std::string sLogLevel = getEnv("DNSPUB_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    Logger::parseLevel(sLogLevel);
    cfg.sLogLevel = sLogLevel;
  }

  cfg.iLockTimeoutSeconds = getEnvInt("DNSPUB_LOCK_TIMEOUT_SECONDS", 180);
  cfg.iDefaultATtlSeconds = getEnvInt("DNSPUB_DEFAULT_A_TTL_SECONDS", 180);
  cfg.iDefaultNsTtlSeconds = getEnvInt("DNSPUB_DEFAULT_NS_TTL_SECONDS", 180);
  cfg.iDefaultDsTtlSeconds = getEnvInt("DNSPUB_DEFAULT_DS_TTL_SECONDS", 180);

  // Default max QPS for the provider; raise together with the provider-side quota.
  cfg.iPdnsMaxQps = getEnvInt("DNSPUB_PDNS_MAX_QPS", 20);
  cfg.iPdnsNumThreads = getEnvInt("DNSPUB_PDNS_NUM_THREADS", 10);

  cfg.iRetryAttempts = getEnvInt("DNSPUB_RETRY_ATTEMPTS", 12);
  cfg.iRetryBaseDelayMs = getEnvInt("DNSPUB_RETRY_BASE_DELAY_MS", 100);
  cfg.iRetryMaxDelayMs = getEnvInt("DNSPUB_RETRY_MAX_DELAY_MS", 10000);

  // ── Validation ─────────────────────────────────────────────────────────
  requireAtLeast("DNSPUB_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("DNSPUB_PDNS_DB_POOL_SIZE", cfg.iPdnsDbPoolSize, 1);
  requireAtLeast("DNSPUB_HTTP_THREADS", cfg.iHttpThreads, 1);
  requireAtLeast("DNSPUB_LOCK_TIMEOUT_SECONDS", cfg.iLockTimeoutSeconds, 1);
  requireAtLeast("DNSPUB_DEFAULT_A_TTL_SECONDS", cfg.iDefaultATtlSeconds, 0);
  requireAtLeast("DNSPUB_DEFAULT_NS_TTL_SECONDS", cfg.iDefaultNsTtlSeconds, 0);
  requireAtLeast("DNSPUB_DEFAULT_DS_TTL_SECONDS", cfg.iDefaultDsTtlSeconds, 0);
  requireAtLeast("DNSPUB_PDNS_MAX_QPS", cfg.iPdnsMaxQps, 1);
  requireAtLeast("DNSPUB_PDNS_NUM_THREADS", cfg.iPdnsNumThreads, 0);
  requireAtLeast("DNSPUB_RETRY_ATTEMPTS", cfg.iRetryAttempts, 1);
  requireAtLeast("DNSPUB_RETRY_BASE_DELAY_MS", cfg.iRetryBaseDelayMs, 0);

  // DNSPUB_RETRY_MAX_DELAY_MS >= DNSPUB_RETRY_BASE_DELAY_MS
  if (cfg.iRetryMaxDelayMs < cfg.iRetryBaseDelayMs) {
    throw std::runtime_error(
        "DNSPUB_RETRY_MAX_DELAY_MS (" + std::to_string(cfg.iRetryMaxDelayMs) +
        ") must be >= DNSPUB_RETRY_BASE_DELAY_MS (" + std::to_string(cfg.iRetryBaseDelayMs) + ")");
  }

  // Each in-flight batch pins one registry connection for its advisory lock
  // and needs at least one more for lookups.
  if (cfg.iDbPoolSize <= cfg.iHttpThreads) {
    throw std::runtime_error(
        "DNSPUB_DB_POOL_SIZE (" + std::to_string(cfg.iDbPoolSize) +
        ") must be > DNSPUB_HTTP_THREADS (" + std::to_string(cfg.iHttpThreads) + ")");
  }

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error("DNSPUB_HTTP_PORT out of range: " + std::to_string(cfg.iHttpPort));
  }

  return cfg;
}

}  // namespace dnspub::common
