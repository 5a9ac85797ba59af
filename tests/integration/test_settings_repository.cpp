#include "dal/SettingsRepository.hpp"

#include "dal/ConnectionPool.hpp"
#include "dal/SchemaMigrator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <string>

using certmon::dal::ConnectionPool;
using certmon::dal::SettingsRepository;

class SettingsRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* pUrl = std::getenv("CERTMON_DB_URL");
    if (pUrl == nullptr || *pUrl == '\0') {
      GTEST_SKIP() << "CERTMON_DB_URL not set, skipping integration test";
    }
    _cpPool = std::make_unique<ConnectionPool>(pUrl, 1);
    certmon::dal::SchemaMigrator(*_cpPool).apply();
    {
      auto cg = _cpPool->checkout();
      pqxx::work txn(*cg);
      txn.exec("DELETE FROM alert_settings");
      txn.commit();
    }
    _srRepo = std::make_unique<SettingsRepository>(*_cpPool);
  }

  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<SettingsRepository> _srRepo;
};

TEST_F(SettingsRepositoryTest, DefaultsWhenNothingSaved) {
  const auto als = _srRepo->get();
  EXPECT_FALSE(als.bWebhookEnabled);
  EXPECT_FALSE(als.bSyncEnabled);
  EXPECT_TRUE(als.sSyncSchedule.empty());
}

TEST_F(SettingsRepositoryTest, SaveMergesPatchIntoStoredDocument) {
  _srRepo->save({{"webhook_enabled", true}, {"webhook_url", "https://hooks.example.net/a"}});
  const auto als = _srRepo->save({{"sync_enabled", true}, {"sync_schedule", "0 */6 * * *"}});

  EXPECT_TRUE(als.bWebhookEnabled);
  EXPECT_EQ(als.sWebhookUrl, "https://hooks.example.net/a");
  EXPECT_TRUE(als.bSyncEnabled);
  EXPECT_EQ(als.sSyncSchedule, "0 */6 * * *");

  const auto alsStored = _srRepo->get();
  EXPECT_EQ(alsStored.sSyncSchedule, "0 */6 * * *");
  EXPECT_EQ(alsStored.sWebhookUrl, "https://hooks.example.net/a");
}

TEST_F(SettingsRepositoryTest, LaterPatchOverridesKey) {
  _srRepo->save({{"notify_on_add_tpl", "first"}});
  _srRepo->save({{"notify_on_add_tpl", "second"}});

  EXPECT_EQ(_srRepo->get().sAddTemplate, "second");
}
