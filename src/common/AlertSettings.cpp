#include "common/AlertSettings.hpp"

#include <nlohmann/json.hpp>

namespace certmon::common {

void to_json(nlohmann::json& j, const AlertSettings& als) {
  j = nlohmann::json{
      {"webhook_enabled", als.bWebhookEnabled},
      {"webhook_url", als.sWebhookUrl},
      {"webhook_user", als.sWebhookUser},
      {"webhook_password", als.sWebhookPassword},
      {"webhook_token", als.sWebhookToken},
      {"telegram_enabled", als.bTelegramEnabled},
      {"telegram_bot_token", als.sTelegramBotToken},
      {"telegram_chat_id", als.sTelegramChatId},
      {"notify_on_expiry", als.bNotifyOnExpiry},
      {"notify_on_expiry_tpl", als.sExpiryTemplate},
      {"notify_on_add", als.bNotifyOnAdd},
      {"notify_on_add_tpl", als.sAddTemplate},
      {"notify_on_delete", als.bNotifyOnDelete},
      {"notify_on_delete_tpl", als.sDeleteTemplate},
      {"notify_on_renew", als.bNotifyOnRenew},
      {"notify_on_renew_tpl", als.sRenewTemplate},
      {"notify_on_update", als.bNotifyOnUpdate},
      {"notify_on_update_tpl", als.sUpdateTemplate},
      {"notify_on_zone_add", als.bNotifyOnZoneAdd},
      {"notify_on_zone_add_tpl", als.sZoneAddTemplate},
      {"notify_on_zone_delete", als.bNotifyOnZoneDelete},
      {"notify_on_zone_delete_tpl", als.sZoneDeleteTemplate},
      {"sync_enabled", als.bSyncEnabled},
      {"sync_schedule", als.sSyncSchedule},
      {"notify_on_sync_finish", als.bNotifyOnSyncFinish},
      {"sync_finish_tpl", als.sSyncFinishTemplate},
      {"scan_enabled", als.bScanEnabled},
      {"scan_schedule", als.sScanSchedule},
      {"notify_on_scan_finish", als.bNotifyOnScanFinish},
      {"scan_finish_tpl", als.sScanFinishTemplate},
  };
}

void from_json(const nlohmann::json& j, AlertSettings& als) {
  const AlertSettings alsDefaults;
  als.bWebhookEnabled = j.value("webhook_enabled", alsDefaults.bWebhookEnabled);
  als.sWebhookUrl = j.value("webhook_url", alsDefaults.sWebhookUrl);
  als.sWebhookUser = j.value("webhook_user", alsDefaults.sWebhookUser);
  als.sWebhookPassword = j.value("webhook_password", alsDefaults.sWebhookPassword);
  als.sWebhookToken = j.value("webhook_token", alsDefaults.sWebhookToken);
  als.bTelegramEnabled = j.value("telegram_enabled", alsDefaults.bTelegramEnabled);
  als.sTelegramBotToken = j.value("telegram_bot_token", alsDefaults.sTelegramBotToken);
  als.sTelegramChatId = j.value("telegram_chat_id", alsDefaults.sTelegramChatId);
  als.bNotifyOnExpiry = j.value("notify_on_expiry", alsDefaults.bNotifyOnExpiry);
  als.sExpiryTemplate = j.value("notify_on_expiry_tpl", alsDefaults.sExpiryTemplate);
  als.bNotifyOnAdd = j.value("notify_on_add", alsDefaults.bNotifyOnAdd);
  als.sAddTemplate = j.value("notify_on_add_tpl", alsDefaults.sAddTemplate);
  als.bNotifyOnDelete = j.value("notify_on_delete", alsDefaults.bNotifyOnDelete);
  als.sDeleteTemplate = j.value("notify_on_delete_tpl", alsDefaults.sDeleteTemplate);
  als.bNotifyOnRenew = j.value("notify_on_renew", alsDefaults.bNotifyOnRenew);
  als.sRenewTemplate = j.value("notify_on_renew_tpl", alsDefaults.sRenewTemplate);
  als.bNotifyOnUpdate = j.value("notify_on_update", alsDefaults.bNotifyOnUpdate);
  als.sUpdateTemplate = j.value("notify_on_update_tpl", alsDefaults.sUpdateTemplate);
  als.bNotifyOnZoneAdd = j.value("notify_on_zone_add", alsDefaults.bNotifyOnZoneAdd);
  als.sZoneAddTemplate = j.value("notify_on_zone_add_tpl", alsDefaults.sZoneAddTemplate);
  als.bNotifyOnZoneDelete = j.value("notify_on_zone_delete", alsDefaults.bNotifyOnZoneDelete);
  als.sZoneDeleteTemplate =
      j.value("notify_on_zone_delete_tpl", alsDefaults.sZoneDeleteTemplate);
  als.bSyncEnabled = j.value("sync_enabled", alsDefaults.bSyncEnabled);
  als.sSyncSchedule = j.value("sync_schedule", alsDefaults.sSyncSchedule);
  als.bNotifyOnSyncFinish = j.value("notify_on_sync_finish", alsDefaults.bNotifyOnSyncFinish);
  als.sSyncFinishTemplate = j.value("sync_finish_tpl", alsDefaults.sSyncFinishTemplate);
  als.bScanEnabled = j.value("scan_enabled", alsDefaults.bScanEnabled);
  als.sScanSchedule = j.value("scan_schedule", alsDefaults.sScanSchedule);
  als.bNotifyOnScanFinish = j.value("notify_on_scan_finish", alsDefaults.bNotifyOnScanFinish);
  als.sScanFinishTemplate = j.value("scan_finish_tpl", alsDefaults.sScanFinishTemplate);
}

}  // namespace certmon::common
