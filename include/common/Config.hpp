#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace certmon::common {

/// Environment variable loader. Every tuning knob of the pipeline lives here and
/// is handed to the component that needs it at construction.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  std::string sProviderToken;  // raw API token (zeroed after handoff to the provider)

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 10;

  // ── DNS provider ──────────────────────────────────────────────────────
  std::string sProviderType = "cloudflare";
  std::string sProviderEndpoint = "https://api.cloudflare.com/client/v4";
  std::vector<std::string> vZoneIds;  // empty = every zone the token can see

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Reconciliation ────────────────────────────────────────────────────
  int iSyncConcurrency = 15;
  int iRescanConcurrency = 10;
  int iStreamCapacity = 500;
  int iSyncTimeoutSeconds = 1200;
  int iRescanTimeoutSeconds = 1800;

  // ── Probing ───────────────────────────────────────────────────────────
  int iProbeTimeoutSeconds = 60;
  int iDialTimeoutSeconds = 15;
  int iRetryAttempts = 3;
  int iRetryBackoffMs = 5000;
  int iWhoisRefreshDays = 60;

  // ── Alerting ──────────────────────────────────────────────────────────
  int iAlertThresholdDays = 30;
  int iAlertCooldownHours = 24;
  int iQueueCapacity = 1000;
  int iSendIntervalMs = 1100;

  // ── Scheduling ────────────────────────────────────────────────────────
  int iSettingsReloadSeconds = 300;

  // ── Skip policy ───────────────────────────────────────────────────────
  std::vector<std::string> vSkipContains{"_domainkey"};
  std::vector<std::string> vSkipLabelPrefixes{"_"};
  std::vector<std::string> vSkipLabelSuffixes;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for CERTMON_CF_API_TOKEN.
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

  /// Read a comma-separated env var. Unset keeps vDefault; set-but-empty clears it.
  static std::vector<std::string> getEnvList(const char* pVarName,
                                             std::vector<std::string> vDefault);
};

}  // namespace certmon::common
