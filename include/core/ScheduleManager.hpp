#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/TaskScheduler.hpp"

namespace certmon::dal {
class ISettingsRepository;
}

namespace certmon::core {

class Reconciler;

/// Bodies of the two settings-driven jobs.
/// Class abbreviation: sj
struct ScheduledJobs {
  TaskScheduler::TaskFn fnSync;
  TaskScheduler::TaskFn fnScan;

  /// sync: performSync, then notifySyncResult when it succeeded.
  /// scan: performRescan.
  static ScheduledJobs forReconciler(std::shared_ptr<Reconciler> spReconciler);
};

/// Keeps the "sync" and "scan" scheduler entries in line with AlertSettings.
/// Class abbreviation: sm
class ScheduleManager {
 public:
  static constexpr const char* kSyncJob = "sync";
  static constexpr const char* kScanJob = "scan";

  ScheduleManager(std::shared_ptr<dal::ISettingsRepository> spSettingsRepo, ScheduledJobs sj,
                  TaskScheduler& tsScheduler);

  /// Re-read settings and register, replace or drop both jobs. An invalid cron
  /// expression is logged and leaves that job unregistered. Errors reading the
  /// settings propagate and leave the current jobs untouched.
  void reload();

 private:
  void applyJob(const char* pName, bool bEnabled, const std::string& sSchedule,
                const TaskScheduler::TaskFn& fnJob);

  std::shared_ptr<dal::ISettingsRepository> _spSettingsRepo;
  ScheduledJobs _sj;
  TaskScheduler& _tsScheduler;
  std::mutex _mtx;
};

}  // namespace certmon::core
