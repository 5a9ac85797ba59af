#include "notify/Notifier.hpp"

#include <optional>
#include <utility>

#include "common/Errors.hpp"
#include "common/HttpClient.hpp"
#include "common/Logger.hpp"
#include "common/TimeUtils.hpp"
#include "dal/HostRepository.hpp"
#include "dal/SettingsRepository.hpp"
#include "notify/AlertChannel.hpp"
#include "notify/DeliveryQueue.hpp"

namespace certmon::notify {

namespace {

using common::EventType;
using common::HostStatus;

const std::string kDefaultExpiry =
    "⚠️ [Monitoring alert]\n"
    "Reason: {{.Reason}}\n"
    "Domain: {{.Domain}}\n"
    "Status: {{.Status}}\n"
    "SSL remaining: {{.Days}} days\n"
    "Registration remaining: {{.DomainDays}} days\n"
    "Expiry: {{.ExpiryDate}}\n"
    "Record: {{.IP}}";
const std::string kDefaultAdd = "✨ [Domain added]\nTarget: {{.Domain}}\nDetails: {{.Details}}";
const std::string kDefaultDelete =
    "🗑 [Domain deleted]\nTarget: {{.Domain}}\nDetails: {{.Details}}";
const std::string kDefaultRenew =
    "♻️ <b>[SSL certificate renewed]</b>\n\n🌐 Domain: <b>{{.Domain}}</b>\n{{.Details}}";
const std::string kDefaultUpdate = "🛠 [DNS change]\nTarget: {{.Domain}}\nChanges: {{.Details}}";
const std::string kDefaultSyncFinish =
    "☁️ [Cloudflare sync finished]\n"
    "Added: {{.Added}}\n"
    "Updated: {{.Updated}}\n"
    "Deleted: {{.Deleted}}\n"
    "Skipped: {{.Skipped}}\n"
    "Duration: {{.Duration}}";
const std::string kDefaultScanFinish =
    "🔍 [SSL scan finished]\n"
    "Total: {{.Total}}\n"
    "Active: {{.Active}}\n"
    "Expired: {{.Expired}}\n"
    "Warning: {{.Warning}}\n"
    "Duration: {{.Duration}}";
const std::string kDefaultZoneAdd =
    "🌍 <b>[Zone added]</b>\nZone: {{.Domain}}\nDetails: {{.Details}}";
const std::string kDefaultZoneDelete =
    "💥 <b>[Zone removed]</b>\nZone: {{.Domain}}\nDetails: {{.Details}}";

const std::string kTestMessage = "🔔 [Test] This is a test alert from certmon.";

/// Toggle, user template and display name for one operation event.
struct OperationSetting {
  bool bEnabled = false;
  std::string sTemplate;
  std::string sAction;
};

std::optional<OperationSetting> operationSetting(const common::AlertSettings& als,
                                                 EventType eventType) {
  switch (eventType) {
    case EventType::Add:
      return OperationSetting{als.bNotifyOnAdd, als.sAddTemplate, "Domain added"};
    case EventType::Delete:
      return OperationSetting{als.bNotifyOnDelete, als.sDeleteTemplate, "Domain deleted"};
    case EventType::Renew:
      return OperationSetting{als.bNotifyOnRenew, als.sRenewTemplate, "SSL renewal"};
    case EventType::Update:
      return OperationSetting{als.bNotifyOnUpdate, als.sUpdateTemplate, "Configuration change"};
    case EventType::ZoneAdd:
      return OperationSetting{als.bNotifyOnZoneAdd, als.sZoneAddTemplate, "Zone added"};
    case EventType::ZoneDelete:
      return OperationSetting{als.bNotifyOnZoneDelete, als.sZoneDeleteTemplate, "Zone removed"};
    default:
      return std::nullopt;
  }
}

bool anyChannelEnabled(const common::AlertSettings& als) {
  return als.bTelegramEnabled || als.bWebhookEnabled;
}

std::string nowText() { return common::formatLocalDateTime(std::chrono::system_clock::now()); }

std::string join(const std::vector<std::string>& vItems, const std::string& sSep) {
  std::string sOut;
  for (size_t i = 0; i < vItems.size(); ++i) {
    if (i > 0) sOut += sSep;
    sOut += vItems[i];
  }
  return sOut;
}

}  // namespace

Notifier::Notifier(NotifierConfig ncfg, std::shared_ptr<dal::ISettingsRepository> spSettingsRepo,
                   std::shared_ptr<dal::IHostRepository> spHostRepo,
                   std::shared_ptr<common::IHttpClient> spHttp)
    : _ncfg(ncfg),
      _spSettingsRepo(std::move(spSettingsRepo)),
      _spHostRepo(std::move(spHostRepo)),
      _spHttp(std::move(spHttp)) {
  for (const char* pKind : {"telegram", "webhook"}) {
    _mQueues.emplace(pKind, std::make_unique<DeliveryQueue>(pKind, _ncfg.uQueueCapacity,
                                                            _ncfg.durSendInterval));
  }
}

Notifier::~Notifier() { shutdown(); }

void Notifier::shutdown() {
  for (auto& [sKind, upQueue] : _mQueues) {
    upQueue->shutdown();
  }
}

const std::string& Notifier::defaultExpiryTemplate() { return kDefaultExpiry; }

const std::string& Notifier::defaultTemplate(EventType eventType) {
  switch (eventType) {
    case EventType::Add:
      return kDefaultAdd;
    case EventType::Delete:
      return kDefaultDelete;
    case EventType::Renew:
      return kDefaultRenew;
    case EventType::Update:
      return kDefaultUpdate;
    case EventType::SyncFinish:
      return kDefaultSyncFinish;
    case EventType::ScanFinish:
      return kDefaultScanFinish;
    case EventType::ZoneAdd:
      return kDefaultZoneAdd;
    case EventType::ZoneDelete:
      return kDefaultZoneDelete;
  }
  return kDefaultUpdate;
}

void Notifier::reloadSettings() {
  if (!_spSettingsRepo) return;
  try {
    auto als = _spSettingsRepo->get();
    std::lock_guard<std::mutex> lock(_mtxSettings);
    _als = std::move(als);
  } catch (const std::exception& e) {
    common::Logger::get()->error("Reloading alert settings failed, keeping previous: {}",
                                 e.what());
  }
}

common::AlertSettings Notifier::settings() const {
  std::lock_guard<std::mutex> lock(_mtxSettings);
  return _als;
}

void Notifier::dispatch(const common::AlertSettings& als, const std::string& sMessage) {
  for (auto& spChannel : buildChannels(als, _spHttp)) {
    const auto it = _mQueues.find(spChannel->kind());
    if (it == _mQueues.end()) continue;
    it->second->enqueue(DeliveryJob{spChannel, sMessage});
  }
}

void Notifier::notifyOperation(EventType eventType, const std::string& sTarget,
                               const std::string& sDetails) {
  const auto als = settings();
  if (!anyChannelEnabled(als)) return;

  const auto oSetting = operationSetting(als, eventType);
  if (!oSetting) {
    common::Logger::get()->warn("notifyOperation called with {}", common::toString(eventType));
    return;
  }
  if (!oSetting->bEnabled) return;

  const std::string& sTemplate =
      oSetting->sTemplate.empty() ? defaultTemplate(eventType) : oSetting->sTemplate;
  OperationTemplateData otd{oSetting->sAction, sTarget, sDetails, nowText()};

  std::string sMessage;
  try {
    sMessage = TemplateEngine::render(sTemplate, TemplateCategory::Operation, otd.toValues());
  } catch (const common::TemplateError& e) {
    common::Logger::get()->error("{} template failed, message dropped: {}",
                                 common::toString(eventType), e.what());
    return;
  }
  dispatch(als, sMessage);
}

void Notifier::notifyTaskFinish(EventType eventType, TaskSummaryData tsd) {
  const auto als = settings();
  if (!anyChannelEnabled(als)) return;

  bool bEnabled = false;
  std::string sTemplate;
  if (eventType == EventType::SyncFinish) {
    bEnabled = als.bNotifyOnSyncFinish;
    sTemplate = als.sSyncFinishTemplate;
  } else if (eventType == EventType::ScanFinish) {
    bEnabled = als.bNotifyOnScanFinish;
    sTemplate = als.sScanFinishTemplate;
  } else {
    common::Logger::get()->warn("notifyTaskFinish called with {}", common::toString(eventType));
    return;
  }
  if (!bEnabled) return;
  if (sTemplate.empty()) sTemplate = defaultTemplate(eventType);

  tsd.sTime = nowText();
  std::string sMessage;
  try {
    sMessage = TemplateEngine::render(sTemplate, TemplateCategory::TaskSummary, tsd.toValues());
  } catch (const common::TemplateError& e) {
    common::Logger::get()->error("{} template failed, message dropped: {}",
                                 common::toString(eventType), e.what());
    return;
  }
  dispatch(als, sMessage);
}

AlertDecision Notifier::evaluate(const common::MonitoredHost& mh, int iThresholdDays) {
  AlertDecision ad;
  const bool bConnError = mh.status == HostStatus::ConnectionError;
  if (mh.bIgnored) return ad;
  if (!mh.oNotAfter && !bConnError) return ad;

  if (bConnError) {
    ad.vReasons.push_back("❌ " + mh.sErrorMessage);
    ad.bNotify = true;
  }

  if (mh.oNotAfter && !bConnError) {
    if (mh.iDaysRemaining < 0) {
      ad.vReasons.push_back("SSL certificate expired");
      ad.bNotify = true;
    } else if (mh.iDaysRemaining < iThresholdDays) {
      ad.vReasons.push_back("SSL certificate expires in " + std::to_string(mh.iDaysRemaining) +
                            " days");
      ad.bNotify = true;
    }
  }

  if (mh.oDomainExpiry) {
    if (mh.iDomainDaysLeft < 0) {
      ad.vReasons.push_back("Domain registration expired");
      ad.bNotify = true;
    } else if (mh.iDomainDaysLeft < iThresholdDays) {
      ad.vReasons.push_back("Domain registration expires in " +
                            std::to_string(mh.iDomainDaysLeft) + " days");
      ad.bNotify = true;
    }
  }

  if (mh.status == HostStatus::Unresolvable) {
    ad.vReasons.push_back("❌ Domain unresolvable");
  } else if (!mh.bIsMatch && !bConnError) {
    ad.vReasons.push_back("❌ Hostname mismatch");
    ad.bNotify = true;
  }
  return ad;
}

void Notifier::checkAndNotify(const common::MonitoredHost& mh) {
  const auto ad = evaluate(mh, _ncfg.iThresholdDays);
  if (!ad.bNotify) return;

  const auto als = settings();
  if (!als.bNotifyOnExpiry || !anyChannelEnabled(als)) return;

  const auto tpNow = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(_mtxAlerts);
    std::optional<common::SysTime> oLast = mh.oLastAlertAt;
    if (const auto it = _mLastAlert.find(mh.iId); it != _mLastAlert.end()) {
      if (!oLast || it->second > *oLast) oLast = it->second;
    }
    if (oLast && tpNow - *oLast < _ncfg.durCooldown) {
      common::Logger::get()->debug("Alert for {} suppressed by cooldown", mh.sHostname);
      return;
    }
    _mLastAlert[mh.iId] = tpNow;
  }

  const std::string sReason = join(ad.vReasons, ", ");
  ExpiryTemplateData etd;
  etd.sDomain = mh.sHostname;
  etd.sStatus = common::toString(mh.status);
  etd.iDays = mh.iDaysRemaining;
  etd.iDomainDays = mh.iDomainDaysLeft;
  etd.sExpiryDate = mh.oNotAfter ? common::formatDate(*mh.oNotAfter) : "";
  etd.sIssuer = mh.sIssuer;
  etd.sIp = mh.sResolvedRecord;
  etd.sTls = mh.sTlsVersion;
  etd.iHttpCode = mh.iHttpStatusCode;
  etd.sRecord = mh.sResolvedRecord;
  etd.sReason = sReason;

  const std::string& sTemplate =
      als.sExpiryTemplate.empty() ? kDefaultExpiry : als.sExpiryTemplate;
  std::string sMessage;
  try {
    sMessage = TemplateEngine::render(sTemplate, TemplateCategory::Expiry, etd.toValues());
  } catch (const common::TemplateError& e) {
    common::Logger::get()->error("Expiry template failed, using built-in: {}", e.what());
    sMessage = TemplateEngine::render(kDefaultExpiry, TemplateCategory::Expiry, etd.toValues());
  }

  if (!TemplateEngine::references(sTemplate, "Reason") &&
      sMessage.find(sReason) == std::string::npos) {
    sMessage += "\nReason: " + sReason;
  }
  if (!mh.bIsMatch && mh.status != HostStatus::ConnectionError &&
      mh.status != HostStatus::Unresolvable) {
    sMessage += "\n❌ [Critical] Certificate does not match the hostname!";
  }

  dispatch(als, sMessage);

  if (_spHostRepo && mh.iId != 0) {
    try {
      _spHostRepo->updateLastAlertTime(mh.iId, tpNow);
    } catch (const std::exception& e) {
      common::Logger::get()->error("Recording alert time for {} failed: {}", mh.sHostname,
                                   e.what());
    }
  }
}

void Notifier::sendTestMessage(const common::AlertSettings& als) {
  const auto vChannels = buildChannels(als, _spHttp);
  if (vChannels.empty()) {
    throw common::DeliveryError("no_channel", "No alert channel is enabled and configured");
  }

  std::vector<std::string> vErrors;
  for (const auto& spChannel : vChannels) {
    try {
      spChannel->send(kTestMessage);
    } catch (const common::DeliveryError& e) {
      vErrors.push_back(e.what());
    }
  }
  if (!vErrors.empty()) {
    throw common::DeliveryError("test_delivery_failed", "Delivery failed: " + join(vErrors, "; "));
  }
}

}  // namespace certmon::notify
