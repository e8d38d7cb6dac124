#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "api/ApiServer.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/MetricsRoutes.hpp"
#include "api/routes/PublishRoutes.hpp"
#include "common/Clock.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/DnsMetrics.hpp"
#include "core/PublishDnsUpdatesAction.hpp"
#include "core/RateLimiter.hpp"
#include "core/Retrier.hpp"
#include "dal/AdvisoryLockHandler.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/DnsQueueRepository.hpp"
#include "dal/RegistryRepository.hpp"
#include "providers/PowerDnsProvider.hpp"
#include "security/TaskSignatureVerifier.hpp"
#include "writers/DnsWriterRegistry.hpp"
#include "writers/ProviderDnsWriter.hpp"
#include "writers/VoidDnsWriter.hpp"

#include <openssl/crypto.h>
#include <spdlog/fmt/ranges.h>

namespace {

constexpr const char* kPowerDnsWriterName = "PowerDnsWriter";

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = dnspub::common::Config::load();

    dnspub::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = dnspub::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Task signature verifier ──────────────────────────────────
    auto tsvVerifier = std::make_unique<dnspub::security::TaskSignatureVerifier>(
        cfgApp.sTaskSecret);
    OPENSSL_cleanse(cfgApp.sTaskSecret.data(), cfgApp.sTaskSecret.size());
    cfgApp.sTaskSecret.clear();
    spLog->info("Step 2: TaskSignatureVerifier initialized");

    // ── Step 3: Connection pools ─────────────────────────────────────────
    auto cpRegistry = std::make_unique<dnspub::dal::ConnectionPool>(
        "registry", cfgApp.sDbUrl, cfgApp.iDbPoolSize);
    auto cpPdns = std::make_unique<dnspub::dal::ConnectionPool>(
        "powerdns", cfgApp.sPdnsDbUrl, cfgApp.iPdnsDbPoolSize);
    OPENSSL_cleanse(cfgApp.sPdnsDbUrl.data(), cfgApp.sPdnsDbUrl.size());
    cfgApp.sPdnsDbUrl.clear();
    spLog->info("Step 3: Connection pools initialized (registry={}, powerdns={})",
                cfgApp.iDbPoolSize, cfgApp.iPdnsDbPoolSize);

    // ── Step 4: Repositories and lock service ────────────────────────────
    auto rgrRegistry = std::make_unique<dnspub::dal::RegistryRepository>(*cpRegistry);
    auto dqrQueue = std::make_unique<dnspub::dal::DnsQueueRepository>(*cpRegistry);
    auto alhLocks = std::make_unique<dnspub::dal::AdvisoryLockHandler>(*cpRegistry);
    spLog->info("Step 4: Repositories ready");

    // ── Step 5: Provider, rate limiter, retrier ──────────────────────────
    auto pdpProvider = std::make_unique<dnspub::providers::PowerDnsProvider>(*cpPdns);
    auto rlPdns = std::make_unique<dnspub::core::RateLimiter>(
        static_cast<double>(cfgApp.iPdnsMaxQps));
    auto rtRetrier = std::make_unique<dnspub::core::Retrier>(
        cfgApp.iRetryAttempts, std::chrono::milliseconds(cfgApp.iRetryBaseDelayMs),
        std::chrono::milliseconds(cfgApp.iRetryMaxDelayMs));
    spLog->info("Step 5: PowerDNS provider ready (qps={}, threads={}, attempts={})",
                cfgApp.iPdnsMaxQps, cfgApp.iPdnsNumThreads, cfgApp.iRetryAttempts);

    // ── Step 6: Writer registry ──────────────────────────────────────────
    const dnspub::common::SystemClock scClock;
    const dnspub::common::RecordTtls rtTtls{
        static_cast<uint32_t>(cfgApp.iDefaultATtlSeconds),
        static_cast<uint32_t>(cfgApp.iDefaultNsTtlSeconds),
        static_cast<uint32_t>(cfgApp.iDefaultDsTtlSeconds)};
    const int iNumThreads = cfgApp.iPdnsNumThreads;

    auto dwrRegistry = std::make_unique<dnspub::writers::DnsWriterRegistry>(*rgrRegistry);
    dwrRegistry->registerWriter(
        kPowerDnsWriterName,
        [&, iNumThreads, rtTtls](const std::string& sZone)
            -> std::unique_ptr<dnspub::writers::IDnsWriter> {
          return std::make_unique<dnspub::writers::ProviderDnsWriter>(
              sZone, *pdpProvider, *rgrRegistry, *rlPdns, iNumThreads, *rtRetrier, rtTtls,
              scClock.now());
        });
    dwrRegistry->registerWriter(
        dnspub::writers::VoidDnsWriter::kName,
        [](const std::string& sZone) -> std::unique_ptr<dnspub::writers::IDnsWriter> {
          return std::make_unique<dnspub::writers::VoidDnsWriter>(sZone);
        });
    spLog->info("Step 6: DNS writers registered: {}",
                fmt::join(dwrRegistry->writerNames(), ", "));

    // ── Step 7: Publish action ───────────────────────────────────────────
    auto dmMetrics = std::make_unique<dnspub::core::DnsMetrics>();
    auto pdaAction = std::make_unique<dnspub::core::PublishDnsUpdatesAction>(
        *alhLocks, *dwrRegistry, *dqrQueue, *dmMetrics, scClock,
        std::chrono::seconds(cfgApp.iLockTimeoutSeconds));
    spLog->info("Step 7: PublishDnsUpdatesAction ready (lock timeout {}s)",
                cfgApp.iLockTimeoutSeconds);

    // ── Step 8: API routes and HTTP server ───────────────────────────────
    auto prRoutes = std::make_unique<dnspub::api::routes::PublishRoutes>(*pdaAction,
                                                                         *tsvVerifier);
    auto hrRoutes = std::make_unique<dnspub::api::routes::HealthRoutes>(
        std::vector<dnspub::providers::IProvider*>{pdpProvider.get()});
    auto mrRoutes = std::make_unique<dnspub::api::routes::MetricsRoutes>(*dmMetrics);

    auto apiServer = std::make_unique<dnspub::api::ApiServer>(*prRoutes, *hrRoutes, *mrRoutes);
    apiServer->registerRoutes();
    spLog->info("Step 8: dns-publisher ready");

    apiServer->start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("HTTP server stopped, shutting down");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
