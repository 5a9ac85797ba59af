#include "core/ScheduleManager.hpp"

#include <utility>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/CronExpression.hpp"
#include "core/Reconciler.hpp"
#include "dal/SettingsRepository.hpp"

namespace certmon::core {

ScheduledJobs ScheduledJobs::forReconciler(std::shared_ptr<Reconciler> spReconciler) {
  ScheduledJobs sj;
  sj.fnSync = [spReconciler](std::stop_token stToken) {
    auto sr = spReconciler->performSync(stToken);
    if (sr.bSuccess) {
      spReconciler->notifySyncResult(sr);
    } else {
      common::Logger::get()->warn("Scheduled sync failed: {}", sr.sErrorMessage);
    }
  };
  sj.fnScan = [spReconciler](std::stop_token stToken) {
    spReconciler->performRescan(stToken);
  };
  return sj;
}

ScheduleManager::ScheduleManager(std::shared_ptr<dal::ISettingsRepository> spSettingsRepo,
                                 ScheduledJobs sj, TaskScheduler& tsScheduler)
    : _spSettingsRepo(std::move(spSettingsRepo)), _sj(std::move(sj)), _tsScheduler(tsScheduler) {}

void ScheduleManager::reload() {
  std::lock_guard<std::mutex> lock(_mtx);
  const auto als = _spSettingsRepo->get();
  applyJob(kSyncJob, als.bSyncEnabled, als.sSyncSchedule, _sj.fnSync);
  applyJob(kScanJob, als.bScanEnabled, als.sScanSchedule, _sj.fnScan);
}

void ScheduleManager::applyJob(const char* pName, bool bEnabled, const std::string& sSchedule,
                               const TaskScheduler::TaskFn& fnJob) {
  auto spLog = common::Logger::get();

  if (!bEnabled || sSchedule.empty()) {
    if (_tsScheduler.unschedule(pName)) {
      spLog->info("Schedule '{}' disabled", pName);
    }
    return;
  }

  if (_tsScheduler.cronText(pName) == sSchedule) return;

  try {
    const auto ceWhen = CronExpression::parse(sSchedule);
    _tsScheduler.scheduleCron(pName, ceWhen, fnJob);
    spLog->info("Schedule '{}' set to '{}'", pName, sSchedule);
  } catch (const common::ValidationError& ex) {
    spLog->error("Schedule '{}' not registered: {}", pName, ex.what());
    _tsScheduler.unschedule(pName);
  }
}

}  // namespace certmon::core
