#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>

#include "api/ApiServer.hpp"
#include "api/BackgroundJobs.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/HostRoutes.hpp"
#include "api/routes/SettingsRoutes.hpp"
#include "api/routes/TaskRoutes.hpp"
#include "common/Config.hpp"
#include "common/HttpClient.hpp"
#include "common/Logger.hpp"
#include "core/DnsResolver.hpp"
#include "core/HttpProbe.hpp"
#include "core/Prober.hpp"
#include "core/Reconciler.hpp"
#include "core/RecordSource.hpp"
#include "core/ScheduleManager.hpp"
#include "core/SkipPolicy.hpp"
#include "core/TaskScheduler.hpp"
#include "core/TlsInspector.hpp"
#include "core/WhoisClient.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/HostRepository.hpp"
#include "dal/SchemaMigrator.hpp"
#include "dal/SettingsRepository.hpp"
#include "notify/Notifier.hpp"
#include "providers/IProvider.hpp"
#include "providers/ProviderFactory.hpp"

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = certmon::common::Config::load();

    certmon::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = certmon::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Global libcurl state ─────────────────────────────────────
    certmon::common::CurlGlobal cgCurl;
    auto spHttp = std::make_shared<certmon::common::CurlHttpClient>();
    spLog->info("Step 2: HTTP client initialized");

    // ── Step 3: Initialize ConnectionPool and schema ─────────────────────
    auto cpPool = std::make_unique<certmon::dal::ConnectionPool>(cfgApp.sDbUrl,
                                                                 cfgApp.iDbPoolSize);
    certmon::dal::SchemaMigrator(*cpPool).apply();
    spLog->info("Step 3: ConnectionPool initialized (size={}), schema applied",
                cfgApp.iDbPoolSize);

    // ── Step 4: Repositories ─────────────────────────────────────────────
    auto spHostRepo = std::make_shared<certmon::dal::HostRepository>(*cpPool);
    auto spSettingsRepo = std::make_shared<certmon::dal::SettingsRepository>(*cpPool);
    spLog->info("Step 4: Repositories ready");

    // ── Step 5: DNS provider ─────────────────────────────────────────────
    std::shared_ptr<certmon::providers::IProvider> spProvider =
        certmon::providers::ProviderFactory::create(cfgApp.sProviderType,
                                                    cfgApp.sProviderEndpoint,
                                                    cfgApp.sProviderToken, spHttp);

    // Zero the provider token from Config after handoff
    OPENSSL_cleanse(cfgApp.sProviderToken.data(), cfgApp.sProviderToken.size());
    cfgApp.sProviderToken.clear();
    spLog->info("Step 5: Provider '{}' constructed", spProvider->name());

    // ── Step 6: Prober ───────────────────────────────────────────────────
    certmon::core::ProberConfig pcfg;
    pcfg.durProbeTimeout = std::chrono::seconds(cfgApp.iProbeTimeoutSeconds);
    pcfg.durDialTimeout = std::chrono::seconds(cfgApp.iDialTimeoutSeconds);
    pcfg.iRetryAttempts = cfgApp.iRetryAttempts;
    pcfg.durRetryBackoff = std::chrono::milliseconds(cfgApp.iRetryBackoffMs);
    pcfg.iWhoisRefreshDays = cfgApp.iWhoisRefreshDays;

    auto spWhois = std::make_shared<certmon::core::WhoisClient>(pcfg.durDialTimeout);
    auto spProber = std::make_shared<certmon::core::NetworkProber>(
        pcfg, std::make_shared<certmon::core::SystemDnsResolver>(),
        std::make_shared<certmon::core::OpenSslTlsInspector>(pcfg.durDialTimeout),
        std::make_shared<certmon::core::CurlHttpProbe>(spHttp), spWhois);
    spLog->info("Step 6: Prober ready (timeout={}s, retries={})", cfgApp.iProbeTimeoutSeconds,
                cfgApp.iRetryAttempts);

    // ── Step 7: Notifier (starts one delivery worker per channel) ────────
    certmon::notify::NotifierConfig ncfg;
    ncfg.iThresholdDays = cfgApp.iAlertThresholdDays;
    ncfg.durCooldown = std::chrono::hours(cfgApp.iAlertCooldownHours);
    ncfg.uQueueCapacity = static_cast<size_t>(cfgApp.iQueueCapacity);
    ncfg.durSendInterval = std::chrono::milliseconds(cfgApp.iSendIntervalMs);
    auto spNotifier =
        std::make_shared<certmon::notify::Notifier>(ncfg, spSettingsRepo, spHostRepo, spHttp);
    spLog->info("Step 7: Notifier started (threshold={}d, cooldown={}h)",
                cfgApp.iAlertThresholdDays, cfgApp.iAlertCooldownHours);

    // ── Step 8: Record source and reconciler ─────────────────────────────
    const certmon::core::SkipPolicy spPolicy(cfgApp.vSkipContains, cfgApp.vSkipLabelPrefixes,
                                             cfgApp.vSkipLabelSuffixes);

    certmon::core::RecordSourceConfig rscfg;
    rscfg.vZoneIds = cfgApp.vZoneIds;
    auto spSource = std::make_shared<certmon::core::ProviderRecordSource>(
        rscfg, spProvider, spWhois, spHostRepo, spPolicy);

    certmon::core::ReconcilerConfig rcfg;
    rcfg.iSyncConcurrency = cfgApp.iSyncConcurrency;
    rcfg.iRescanConcurrency = cfgApp.iRescanConcurrency;
    rcfg.uStreamCapacity = static_cast<size_t>(cfgApp.iStreamCapacity);
    rcfg.durSyncTimeout = std::chrono::seconds(cfgApp.iSyncTimeoutSeconds);
    rcfg.durRescanTimeout = std::chrono::seconds(cfgApp.iRescanTimeoutSeconds);
    auto spReconciler = std::make_shared<certmon::core::Reconciler>(
        rcfg, spSource, spProber, spHostRepo, spNotifier, spPolicy);
    spLog->info("Step 8: Reconciler ready (sync width={}, rescan width={})",
                cfgApp.iSyncConcurrency, cfgApp.iRescanConcurrency);

    // ── Step 9: TaskScheduler and ScheduleManager ────────────────────────
    certmon::core::TaskScheduler tsScheduler;
    certmon::core::ScheduleManager smManager(
        spSettingsRepo, certmon::core::ScheduledJobs::forReconciler(spReconciler), tsScheduler);
    smManager.reload();

    tsScheduler.scheduleInterval("settings-reload",
                                 std::chrono::seconds(cfgApp.iSettingsReloadSeconds),
                                 [&smManager](std::stop_token) { smManager.reload(); });
    tsScheduler.start();
    spLog->info("Step 9: TaskScheduler started (settings reload every {}s)",
                cfgApp.iSettingsReloadSeconds);

    // ── Step 10: API routes ──────────────────────────────────────────────
    certmon::api::BackgroundJobs bjJobs;
    certmon::api::routes::HealthRoutes hlrHealth(spReconciler, tsScheduler);
    certmon::api::routes::TaskRoutes trTasks(spReconciler, spProber, spHostRepo, bjJobs);
    certmon::api::routes::HostRoutes hrHosts(spHostRepo, spNotifier);
    certmon::api::routes::SettingsRoutes srSettings(spSettingsRepo, spNotifier, smManager);

    certmon::api::ApiServer apiServer(hlrHealth, trTasks, hrHosts, srSettings);
    apiServer.registerRoutes();
    spLog->info("Step 10: API routes registered");

    // ── Step 11: HTTP server (blocks until SIGINT/SIGTERM) ───────────────
    spLog->info("certmon ready");
    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    // Graceful shutdown
    spLog->info("Shutting down");
    tsScheduler.stop();
    spLog->info("TaskScheduler stopped");
    bjJobs.stopAll();
    spLog->info("Background jobs stopped");
    spNotifier->shutdown();
    spLog->info("Notifier stopped");
    certmon::common::Logger::shutdown();

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
