#include "dal/HostRepository.hpp"

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SchemaMigrator.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

using certmon::common::HostFilter;
using certmon::common::HostStatus;
using certmon::common::MonitoredHost;
using certmon::dal::ConnectionPool;
using certmon::dal::HostRepository;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("CERTMON_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

MonitoredHost providerHost(const std::string& sHostname, const std::string& sZoneName) {
  MonitoredHost mh;
  mh.sHostname = sHostname;
  mh.sZoneId = "zone-" + sZoneName;
  mh.sRecordId = "rec-" + sHostname;
  mh.sZoneName = sZoneName;
  mh.sRecordType = "A";
  mh.sTarget = "192.0.2.1";
  mh.status = HostStatus::Active;
  mh.bIsMatch = true;
  mh.sIssuer = "Test CA";
  mh.iDaysRemaining = 60;
  mh.oNotAfter = certmon::common::makeUtc(2031, 6, 1);
  mh.vSans = {sHostname, "*." + sZoneName};
  mh.vResolvedIps = {"192.0.2.1"};
  return mh;
}

}  // namespace

class HostRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string sDbUrl = getDbUrl();
    if (sDbUrl.empty()) {
      GTEST_SKIP() << "CERTMON_DB_URL not set, skipping integration test";
    }
    _cpPool = std::make_unique<ConnectionPool>(sDbUrl, 2);
    certmon::dal::SchemaMigrator(*_cpPool).apply();
    {
      auto cg = _cpPool->checkout();
      pqxx::work txn(*cg);
      txn.exec("TRUNCATE monitored_hosts RESTART IDENTITY");
      txn.commit();
    }
    _hrRepo = std::make_unique<HostRepository>(*_cpPool);
  }

  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<HostRepository> _hrRepo;
};

TEST_F(HostRepositoryTest, UpsertInsertsAndRoundTrips) {
  const int64_t iId = _hrRepo->upsert(providerHost("www.example.com", "example.com"));

  auto oHost = _hrRepo->findById(iId);
  ASSERT_TRUE(oHost.has_value());
  EXPECT_EQ(oHost->sHostname, "www.example.com");
  EXPECT_EQ(oHost->status, HostStatus::Active);
  EXPECT_EQ(oHost->vSans.size(), 2u);
  EXPECT_EQ(oHost->vResolvedIps, std::vector<std::string>{"192.0.2.1"});
  ASSERT_TRUE(oHost->oNotAfter.has_value());
  EXPECT_EQ(*oHost->oNotAfter, certmon::common::makeUtc(2031, 6, 1));
  EXPECT_FALSE(oHost->bIgnored);
  EXPECT_TRUE(oHost->oCreatedAt.has_value());
  EXPECT_TRUE(oHost->oLastCheckAt.has_value());
}

TEST_F(HostRepositoryTest, UpsertKeepsUserOwnedFields) {
  auto mh = providerHost("www.example.com", "example.com");
  const int64_t iId = _hrRepo->upsert(mh);
  _hrRepo->updateUserSettings(iId, true, 8443, true);

  mh.sTarget = "198.51.100.9";
  mh.status = HostStatus::Expired;
  const int64_t iSameId = _hrRepo->upsert(mh);

  EXPECT_EQ(iSameId, iId);
  auto oHost = _hrRepo->findById(iId);
  ASSERT_TRUE(oHost.has_value());
  EXPECT_EQ(oHost->sTarget, "198.51.100.9");
  EXPECT_EQ(oHost->status, HostStatus::Expired);
  EXPECT_TRUE(oHost->bIgnored);
  EXPECT_EQ(oHost->iPort, 8443);
  EXPECT_TRUE(oHost->bAutoRenew);
}

TEST_F(HostRepositoryTest, CreateStoresManualHost) {
  MonitoredHost mh;
  mh.sHostname = "legacy.example.net";
  mh.sRecordType = "manual";
  mh.iPort = 8443;
  mh.status = HostStatus::Pending;
  const int64_t iId = _hrRepo->create(mh);

  auto oHost = _hrRepo->findByHostname("legacy.example.net");
  ASSERT_TRUE(oHost.has_value());
  EXPECT_EQ(oHost->iId, iId);
  EXPECT_TRUE(oHost->isManual());
  EXPECT_EQ(oHost->iPort, 8443);
}

TEST_F(HostRepositoryTest, ListFiltersAndPaginates) {
  _hrRepo->upsert(providerHost("a.example.com", "example.com"));
  _hrRepo->upsert(providerHost("b.example.com", "example.com"));
  auto mhDown = providerHost("c.example.org", "example.org");
  mhDown.status = HostStatus::Unresolvable;
  _hrRepo->upsert(mhDown);
  const int64_t iIgnored = _hrRepo->upsert(providerHost("d.example.org", "example.org"));
  _hrRepo->batchUpdateIgnored({iIgnored}, true);

  HostFilter hf;
  hf.iPageSize = 2;
  auto hp = _hrRepo->list(hf);
  EXPECT_EQ(hp.iTotal, 3);
  ASSERT_EQ(hp.vHosts.size(), 2u);
  EXPECT_EQ(hp.vHosts[0].sHostname, "c.example.org");

  hf = HostFilter{};
  hf.sZone = "example.com";
  EXPECT_EQ(_hrRepo->list(hf).iTotal, 2);

  hf = HostFilter{};
  hf.sStatus = "active_only";
  EXPECT_EQ(_hrRepo->list(hf).iTotal, 2);

  hf = HostFilter{};
  hf.sIgnored = "true";
  EXPECT_EQ(_hrRepo->list(hf).iTotal, 1);

  hf = HostFilter{};
  hf.sIgnored = "all";
  hf.sSearch = "EXAMPLE.ORG";
  EXPECT_EQ(_hrRepo->list(hf).iTotal, 2);
}

TEST_F(HostRepositoryTest, UnknownStatusFilterIsRejected) {
  HostFilter hf;
  hf.sStatus = "bogus";
  EXPECT_THROW(_hrRepo->list(hf), certmon::common::ValidationError);
}

TEST_F(HostRepositoryTest, ListZonesIsDistinctAndSorted) {
  _hrRepo->upsert(providerHost("a.example.org", "example.org"));
  _hrRepo->upsert(providerHost("a.example.com", "example.com"));
  _hrRepo->upsert(providerHost("b.example.com", "example.com"));

  EXPECT_EQ(_hrRepo->listZones(), (std::vector<std::string>{"example.com", "example.org"}));
}

TEST_F(HostRepositoryTest, DeleteById) {
  const int64_t iId = _hrRepo->upsert(providerHost("www.example.com", "example.com"));

  EXPECT_TRUE(_hrRepo->deleteById(iId));
  EXPECT_FALSE(_hrRepo->deleteById(iId));
  EXPECT_FALSE(_hrRepo->findById(iId).has_value());
}

TEST_F(HostRepositoryTest, UpdateUserSettingsOnMissingHostThrows) {
  EXPECT_THROW(_hrRepo->updateUserSettings(999, false, 443, false),
               certmon::common::NotFoundError);
}

TEST_F(HostRepositoryTest, UpdateProbeFieldsAndAlertTime) {
  auto mh = providerHost("www.example.com", "example.com");
  mh.iId = _hrRepo->upsert(mh);
  mh.status = HostStatus::ConnectionError;
  mh.sErrorMessage = "Connection refused";
  mh.iLatencyMs = 120;
  _hrRepo->updateProbeFields(mh);
  const auto tpAlert = certmon::common::makeUtc(2026, 10, 1);
  _hrRepo->updateLastAlertTime(mh.iId, tpAlert);

  auto oHost = _hrRepo->findById(mh.iId);
  ASSERT_TRUE(oHost.has_value());
  EXPECT_EQ(oHost->status, HostStatus::ConnectionError);
  EXPECT_EQ(oHost->sErrorMessage, "Connection refused");
  EXPECT_EQ(oHost->iLatencyMs, 120);
  ASSERT_TRUE(oHost->oLastAlertAt.has_value());
  EXPECT_EQ(*oHost->oLastAlertAt, tpAlert);
}

TEST_F(HostRepositoryTest, AggregateStatistics) {
  auto mhSoon = providerHost("soon.example.com", "example.com");
  mhSoon.iDaysRemaining = 5;
  _hrRepo->upsert(mhSoon);
  auto mhMonth = providerHost("month.example.com", "example.com");
  mhMonth.iDaysRemaining = 20;
  mhMonth.bIsMatch = false;
  _hrRepo->upsert(mhMonth);
  auto mhDown = providerHost("down.example.org", "example.org");
  mhDown.status = HostStatus::ConnectionError;
  mhDown.sIssuer.clear();
  _hrRepo->upsert(mhDown);
  const int64_t iIgnored = _hrRepo->upsert(providerHost("quiet.example.org", "example.org"));
  _hrRepo->batchUpdateIgnored({iIgnored}, true);

  const auto as = _hrRepo->getAggregateStatistics();
  EXPECT_EQ(as.iTotal, 3);
  EXPECT_EQ(as.iIgnored, 1);
  EXPECT_EQ(as.iZones, 2);
  EXPECT_EQ(as.iConnectionErrors, 1);
  EXPECT_EQ(as.iMismatched, 1);
  EXPECT_EQ(as.iExpiring7, 1);
  EXPECT_EQ(as.iExpiring15, 1);
  EXPECT_EQ(as.iExpiring30, 2);
  EXPECT_EQ(as.mStatusCounts.at("active"), 2);
  EXPECT_EQ(as.mIssuerCounts.at("Unknown"), 1);
}
