#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/AlertSettings.hpp"
#include "common/Types.hpp"
#include "notify/TemplateEngine.hpp"

namespace certmon::common {
class IHttpClient;
}

namespace certmon::dal {
class IHostRepository;
class ISettingsRepository;
}  // namespace certmon::dal

namespace certmon::notify {

class DeliveryQueue;

/// Alert dispatch seam used by the reconciler and the API.
/// Every method except sendTestMessage returns without waiting for delivery.
class INotifier {
 public:
  virtual ~INotifier() = default;

  /// Lifecycle event: ADD, DELETE, RENEW, UPDATE, ZONE_ADD, ZONE_DELETE.
  virtual void notifyOperation(common::EventType eventType, const std::string& sTarget,
                               const std::string& sDetails) = 0;

  /// Run summary: SYNC_FINISH or SCAN_FINISH.
  virtual void notifyTaskFinish(common::EventType eventType, TaskSummaryData tsd) = 0;

  /// Evaluate expiry, registration, mismatch and connectivity conditions for
  /// one host and alert at most once per cooldown window.
  virtual void checkAndNotify(const common::MonitoredHost& mh) = 0;

  /// Deliver a fixed test message synchronously through als (which need not
  /// be saved). Throws common::DeliveryError.
  virtual void sendTestMessage(const common::AlertSettings& als) = 0;

  /// Re-read AlertSettings from storage. Keeps the previous copy on failure.
  virtual void reloadSettings() = 0;
};

/// Class abbreviation: ncfg
struct NotifierConfig {
  int iThresholdDays = 30;
  std::chrono::hours durCooldown{24};
  size_t uQueueCapacity = 1000;
  std::chrono::milliseconds durSendInterval{1100};
};

/// Outcome of evaluating one host against the alert rules.
/// Class abbreviation: ad
struct AlertDecision {
  bool bNotify = false;
  std::vector<std::string> vReasons;
};

/// Template-driven notifier with one paced DeliveryQueue per channel kind.
/// Class abbreviation: ntf
class Notifier : public INotifier {
 public:
  /// spHostRepo may be null; last_alert_at is then tracked in memory only.
  Notifier(NotifierConfig ncfg, std::shared_ptr<dal::ISettingsRepository> spSettingsRepo,
           std::shared_ptr<dal::IHostRepository> spHostRepo,
           std::shared_ptr<common::IHttpClient> spHttp);
  ~Notifier() override;

  void notifyOperation(common::EventType eventType, const std::string& sTarget,
                       const std::string& sDetails) override;
  void notifyTaskFinish(common::EventType eventType, TaskSummaryData tsd) override;
  void checkAndNotify(const common::MonitoredHost& mh) override;
  void sendTestMessage(const common::AlertSettings& als) override;
  void reloadSettings() override;

  /// Stop all delivery workers. Queued messages are discarded. Idempotent.
  void shutdown();

  common::AlertSettings settings() const;

  /// Pure rule evaluation, no cooldown. Ignored hosts and hosts without a known
  /// certificate (unless in connection_error) never notify.
  static AlertDecision evaluate(const common::MonitoredHost& mh, int iThresholdDays);

  /// Built-in template for an event type; EventType has no expiry member, so
  /// the expiry default has its own accessor.
  static const std::string& defaultTemplate(common::EventType eventType);
  static const std::string& defaultExpiryTemplate();

 private:
  void dispatch(const common::AlertSettings& als, const std::string& sMessage);

  NotifierConfig _ncfg;
  std::shared_ptr<dal::ISettingsRepository> _spSettingsRepo;
  std::shared_ptr<dal::IHostRepository> _spHostRepo;
  std::shared_ptr<common::IHttpClient> _spHttp;

  mutable std::mutex _mtxSettings;
  common::AlertSettings _als;

  std::mutex _mtxAlerts;
  std::map<int64_t, common::SysTime> _mLastAlert;

  std::map<std::string, std::unique_ptr<DeliveryQueue>> _mQueues;
};

}  // namespace certmon::notify
