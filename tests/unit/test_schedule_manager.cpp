#include "core/ScheduleManager.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "fakes/Fakes.hpp"

using certmon::core::ScheduledJobs;
using certmon::core::ScheduleManager;
using certmon::core::TaskScheduler;
using certmon::test::FakeSettingsRepository;

class ScheduleManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _spSettings = std::make_shared<FakeSettingsRepository>();
    _sj.fnSync = [](std::stop_token) {};
    _sj.fnScan = [](std::stop_token) {};
  }

  std::shared_ptr<FakeSettingsRepository> _spSettings;
  ScheduledJobs _sj;
  TaskScheduler _ts;
};

TEST_F(ScheduleManagerTest, DisabledJobsAreNotRegistered) {
  _spSettings->als.bSyncEnabled = false;
  _spSettings->als.sSyncSchedule = "0 3 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);

  sm.reload();

  EXPECT_FALSE(_ts.has(ScheduleManager::kSyncJob));
  EXPECT_FALSE(_ts.has(ScheduleManager::kScanJob));
}

TEST_F(ScheduleManagerTest, EnabledJobsFollowSettings) {
  _spSettings->als.bSyncEnabled = true;
  _spSettings->als.sSyncSchedule = "0 3 * * *";
  _spSettings->als.bScanEnabled = true;
  _spSettings->als.sScanSchedule = "30 */6 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);

  sm.reload();

  EXPECT_EQ(_ts.cronText(ScheduleManager::kSyncJob).value_or(""), "0 3 * * *");
  EXPECT_EQ(_ts.cronText(ScheduleManager::kScanJob).value_or(""), "30 */6 * * *");
}

TEST_F(ScheduleManagerTest, ChangedScheduleReplacesJob) {
  _spSettings->als.bSyncEnabled = true;
  _spSettings->als.sSyncSchedule = "0 3 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);
  sm.reload();

  _spSettings->als.sSyncSchedule = "15 4 * * 1";
  sm.reload();

  EXPECT_EQ(_ts.cronText(ScheduleManager::kSyncJob).value_or(""), "15 4 * * 1");
}

TEST_F(ScheduleManagerTest, DisablingRemovesJob) {
  _spSettings->als.bScanEnabled = true;
  _spSettings->als.sScanSchedule = "0 1 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);
  sm.reload();
  ASSERT_TRUE(_ts.has(ScheduleManager::kScanJob));

  _spSettings->als.bScanEnabled = false;
  sm.reload();

  EXPECT_FALSE(_ts.has(ScheduleManager::kScanJob));
}

TEST_F(ScheduleManagerTest, InvalidScheduleLeavesJobUnregistered) {
  _spSettings->als.bSyncEnabled = true;
  _spSettings->als.sSyncSchedule = "0 3 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);
  sm.reload();

  _spSettings->als.sSyncSchedule = "every day";
  EXPECT_NO_THROW(sm.reload());

  EXPECT_FALSE(_ts.has(ScheduleManager::kSyncJob));
}

TEST_F(ScheduleManagerTest, SettingsErrorKeepsCurrentJobs) {
  _spSettings->als.bSyncEnabled = true;
  _spSettings->als.sSyncSchedule = "0 3 * * *";
  ScheduleManager sm(_spSettings, _sj, _ts);
  sm.reload();

  _spSettings->bFail = true;
  EXPECT_THROW(sm.reload(), std::runtime_error);

  EXPECT_TRUE(_ts.has(ScheduleManager::kSyncJob));
}
