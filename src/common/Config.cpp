#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "common/Logger.hpp"

namespace certmon::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto uStart = sValue.find_first_not_of(" \t\r\n");
  if (uStart == std::string::npos) return "";
  const auto uEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(uStart, uEnd - uStart + 1);
}

void requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMin) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t uUsed = 0;
    const int iValue = std::stoi(sValue, &uUsed);
    if (uUsed != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::vector<std::string> Config::getEnvList(const char* pVarName,
                                            std::vector<std::string> vDefault) {
  const char* pValue = std::getenv(pVarName);
  if (pValue == nullptr) {
    return vDefault;
  }

  std::vector<std::string> vItems;
  std::istringstream iss(pValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    sItem = trim(sItem);
    if (!sItem.empty()) {
      vItems.push_back(sItem);
    }
  }
  return vItems;
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
  cfg.sDbUrl = getEnv("CERTMON_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable CERTMON_DB_URL is not set");
  }
  cfg.sProviderToken = loadSecret("CERTMON_CF_API_TOKEN");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("CERTMON_DB_POOL_SIZE", cfg.iDbPoolSize);

  const std::string sProvider = getEnv("CERTMON_PROVIDER");
  if (!sProvider.empty()) {
    cfg.sProviderType = sProvider;
  }
  const std::string sEndpoint = getEnv("CERTMON_CF_API_ENDPOINT");
  if (!sEndpoint.empty()) {
    cfg.sProviderEndpoint = sEndpoint;
  }
  cfg.vZoneIds = getEnvList("CERTMON_ZONE_IDS", {});

  cfg.iHttpPort = getEnvInt("CERTMON_HTTP_PORT", cfg.iHttpPort);
  cfg.iHttpThreads = getEnvInt("CERTMON_HTTP_THREADS", cfg.iHttpThreads);

  const std::string sLogLevel = getEnv("CERTMON_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // Reconciliation
  cfg.iSyncConcurrency = getEnvInt("CERTMON_SYNC_CONCURRENCY", cfg.iSyncConcurrency);
  cfg.iRescanConcurrency = getEnvInt("CERTMON_RESCAN_CONCURRENCY", cfg.iRescanConcurrency);
  cfg.iStreamCapacity = getEnvInt("CERTMON_STREAM_CAPACITY", cfg.iStreamCapacity);
  cfg.iSyncTimeoutSeconds = getEnvInt("CERTMON_SYNC_TIMEOUT_SECONDS", cfg.iSyncTimeoutSeconds);
  cfg.iRescanTimeoutSeconds =
      getEnvInt("CERTMON_RESCAN_TIMEOUT_SECONDS", cfg.iRescanTimeoutSeconds);

  // Probing
  cfg.iProbeTimeoutSeconds =
      getEnvInt("CERTMON_PROBE_TIMEOUT_SECONDS", cfg.iProbeTimeoutSeconds);
  cfg.iDialTimeoutSeconds = getEnvInt("CERTMON_DIAL_TIMEOUT_SECONDS", cfg.iDialTimeoutSeconds);
  cfg.iRetryAttempts = getEnvInt("CERTMON_RETRY_ATTEMPTS", cfg.iRetryAttempts);
  cfg.iRetryBackoffMs = getEnvInt("CERTMON_RETRY_BACKOFF_MS", cfg.iRetryBackoffMs);
  cfg.iWhoisRefreshDays = getEnvInt("CERTMON_WHOIS_REFRESH_DAYS", cfg.iWhoisRefreshDays);

  // Alerting
  cfg.iAlertThresholdDays = getEnvInt("CERTMON_ALERT_THRESHOLD_DAYS", cfg.iAlertThresholdDays);
  cfg.iAlertCooldownHours = getEnvInt("CERTMON_ALERT_COOLDOWN_HOURS", cfg.iAlertCooldownHours);
  cfg.iQueueCapacity = getEnvInt("CERTMON_QUEUE_CAPACITY", cfg.iQueueCapacity);
  cfg.iSendIntervalMs = getEnvInt("CERTMON_SEND_INTERVAL_MS", cfg.iSendIntervalMs);

  cfg.iSettingsReloadSeconds =
      getEnvInt("CERTMON_SETTINGS_RELOAD_SECONDS", cfg.iSettingsReloadSeconds);

  // Skip policy
  cfg.vSkipContains = getEnvList("CERTMON_SKIP_CONTAINS", cfg.vSkipContains);
  cfg.vSkipLabelPrefixes = getEnvList("CERTMON_SKIP_LABEL_PREFIXES", cfg.vSkipLabelPrefixes);
  cfg.vSkipLabelSuffixes = getEnvList("CERTMON_SKIP_LABEL_SUFFIXES", cfg.vSkipLabelSuffixes);

  // ── Validation ─────────────────────────────────────────────────────────
  if (!Logger::isValidLevel(cfg.sLogLevel)) {
    throw std::runtime_error("CERTMON_LOG_LEVEL must be one of trace, debug, info, warn, error, "
                             "critical, off (got '" + cfg.sLogLevel + "')");
  }
  requireAtLeast("CERTMON_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("CERTMON_SYNC_CONCURRENCY", cfg.iSyncConcurrency, 1);
  requireAtLeast("CERTMON_RESCAN_CONCURRENCY", cfg.iRescanConcurrency, 1);
  requireAtLeast("CERTMON_STREAM_CAPACITY", cfg.iStreamCapacity, 1);
  requireAtLeast("CERTMON_RETRY_ATTEMPTS", cfg.iRetryAttempts, 1);
  requireAtLeast("CERTMON_QUEUE_CAPACITY", cfg.iQueueCapacity, 1);
  requireAtLeast("CERTMON_DIAL_TIMEOUT_SECONDS", cfg.iDialTimeoutSeconds, 1);
  requireAtLeast("CERTMON_SETTINGS_RELOAD_SECONDS", cfg.iSettingsReloadSeconds, 1);

  // CERTMON_PROBE_TIMEOUT_SECONDS > CERTMON_DIAL_TIMEOUT_SECONDS
  if (cfg.iProbeTimeoutSeconds <= cfg.iDialTimeoutSeconds) {
    throw std::runtime_error(
        "CERTMON_PROBE_TIMEOUT_SECONDS (" + std::to_string(cfg.iProbeTimeoutSeconds) +
        ") must be > CERTMON_DIAL_TIMEOUT_SECONDS (" +
        std::to_string(cfg.iDialTimeoutSeconds) + ")");
  }

  return cfg;
}

}  // namespace certmon::common
