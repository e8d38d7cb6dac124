#pragma once

#include <string>

namespace dnspub::common {

/// Environment variable loader for the publisher process.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  std::string sPdnsDbUrl;    // raw URL incl. password (zeroed after handoff to the pool)
  std::string sTaskSecret;   // raw secret (zeroed after handoff to TaskSignatureVerifier)

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 10;
  int iPdnsDbPoolSize = 4;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Publishing ────────────────────────────────────────────────────────
  int iLockTimeoutSeconds = 180;
  int iDefaultATtlSeconds = 180;
  int iDefaultNsTtlSeconds = 180;
  int iDefaultDsTtlSeconds = 180;

  // ── PowerDNS writer ───────────────────────────────────────────────────
  int iPdnsMaxQps = 20;
  int iPdnsNumThreads = 10;  // below 2 disables the fetch fan-out

  // ── Retry ─────────────────────────────────────────────────────────────
  int iRetryAttempts = 12;
  int iRetryBaseDelayMs = 100;
  int iRetryMaxDelayMs = 10000;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for DNSPUB_PDNS_DB_URL and DNSPUB_TASK_SECRET.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Throw unless iValue >= iMin.
  static void requireAtLeast(const char* pVarName, int iValue, int iMin);
};

}  // namespace dnspub::common
