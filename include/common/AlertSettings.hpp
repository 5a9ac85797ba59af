#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace certmon::common {

/// Process-wide notification and scheduling settings.
/// Stored as one JSON document; field names match the stored keys.
/// Empty template strings mean "use the built-in default".
/// Class abbreviation: als
struct AlertSettings {
  // ── Webhook ───────────────────────────────────────────────────────────
  bool bWebhookEnabled = false;
  std::string sWebhookUrl;
  std::string sWebhookUser;
  std::string sWebhookPassword;
  std::string sWebhookToken;  // bearer token; takes precedence over basic auth

  // ── Telegram ──────────────────────────────────────────────────────────
  bool bTelegramEnabled = false;
  std::string sTelegramBotToken;
  std::string sTelegramChatId;

  // ── Per-event toggles and templates ───────────────────────────────────
  bool bNotifyOnExpiry = false;
  std::string sExpiryTemplate;
  bool bNotifyOnAdd = false;
  std::string sAddTemplate;
  bool bNotifyOnDelete = false;
  std::string sDeleteTemplate;
  bool bNotifyOnRenew = false;
  std::string sRenewTemplate;
  bool bNotifyOnUpdate = false;
  std::string sUpdateTemplate;
  bool bNotifyOnZoneAdd = false;
  std::string sZoneAddTemplate;
  bool bNotifyOnZoneDelete = false;
  std::string sZoneDeleteTemplate;

  // ── Synchronization schedule ──────────────────────────────────────────
  bool bSyncEnabled = false;
  std::string sSyncSchedule;
  bool bNotifyOnSyncFinish = false;
  std::string sSyncFinishTemplate;

  // ── Full rescan schedule ──────────────────────────────────────────────
  bool bScanEnabled = false;
  std::string sScanSchedule;
  bool bNotifyOnScanFinish = false;
  std::string sScanFinishTemplate;
};

void to_json(nlohmann::json& j, const AlertSettings& als);

/// Missing keys keep their defaults, so partial documents load cleanly.
void from_json(const nlohmann::json& j, AlertSettings& als);

}  // namespace certmon::common
