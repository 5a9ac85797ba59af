#include "core/HostDiff.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "common/TimeUtils.hpp"

using namespace certmon;
using certmon::common::HostStatus;
using certmon::common::MonitoredHost;
using namespace std::chrono_literals;

namespace {

MonitoredHost baseHost() {
  MonitoredHost mh;
  mh.sHostname = "a.example.com";
  mh.sZoneId = "z1";
  mh.sZoneName = "example.com";
  mh.sRecordType = "A";
  mh.sTarget = "192.0.2.1";
  mh.status = HostStatus::Active;
  mh.oNotAfter = common::makeUtc(2026, 6, 1);
  return mh;
}

}  // namespace

TEST(HostDiffTest, RenewalNeedsMoreThanOneDayLaterExpiry) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;

  mhNew.oNotAfter = *mhPrior.oNotAfter + 24h;
  EXPECT_FALSE(core::isRenewal(mhPrior, mhNew));

  mhNew.oNotAfter = *mhPrior.oNotAfter + 25h;
  EXPECT_TRUE(core::isRenewal(mhPrior, mhNew));

  mhNew.oNotAfter.reset();
  EXPECT_FALSE(core::isRenewal(mhPrior, mhNew));
}

TEST(HostDiffTest, NoChangesForIdenticalProbe) {
  const auto mh = baseHost();
  EXPECT_TRUE(core::computeStateChanges(mh, mh).empty());
  EXPECT_TRUE(core::computeConfigChanges(mh, mh).empty());
}

TEST(HostDiffTest, RenewalLineComesFirst) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;
  mhNew.oNotAfter = common::makeUtc(2026, 9, 1);
  mhNew.iDaysRemaining = 90;
  mhNew.status = HostStatus::Warning;

  const auto vChanges = core::computeStateChanges(mhPrior, mhNew);

  ASSERT_EQ(vChanges.size(), 2u);
  EXPECT_NE(vChanges[0].find("renewed"), std::string::npos);
  EXPECT_NE(vChanges[0].find("2026-06-01"), std::string::npos);
  EXPECT_NE(vChanges[0].find("2026-09-01"), std::string::npos);
  EXPECT_NE(vChanges[1].find("active ➔ warning"), std::string::npos);
}

TEST(HostDiffTest, EnteringConnectionErrorIsNotReported) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;
  mhNew.status = HostStatus::ConnectionError;
  mhNew.sErrorMessage = "Connection refused";

  EXPECT_TRUE(core::computeStateChanges(mhPrior, mhNew).empty());
}

TEST(HostDiffTest, RecoveryIsLabelled) {
  auto mhPrior = baseHost();
  mhPrior.status = HostStatus::ConnectionError;
  auto mhNew = baseHost();

  const auto vChanges = core::computeStateChanges(mhPrior, mhNew);

  ASSERT_EQ(vChanges.size(), 1u);
  EXPECT_NE(vChanges[0].find("Connection restored"), std::string::npos);
}

TEST(HostDiffTest, ConfigDriftListsTargetTypeAndProxy) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;
  mhNew.sTarget = "lb.example.net";
  mhNew.sRecordType = "CNAME";
  mhNew.bProxied = true;

  const auto vChanges = core::computeConfigChanges(mhPrior, mhNew);

  ASSERT_EQ(vChanges.size(), 3u);
  EXPECT_NE(vChanges[0].find("lb.example.net"), std::string::npos);
  EXPECT_EQ(vChanges[1], "Type: A ➔ CNAME");
  EXPECT_EQ(vChanges[2], "Proxy: DNS Only ➔ Proxied");
}

TEST(HostDiffTest, NewErrorMessageIsReported) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;
  mhNew.status = HostStatus::Unresolvable;
  mhNew.sErrorMessage = "NXDOMAIN";

  const auto vChanges = core::computeStateChanges(mhPrior, mhNew);

  ASSERT_EQ(vChanges.size(), 2u);
  EXPECT_EQ(vChanges[1], "Error: NXDOMAIN");
}

TEST(HostDiffTest, ProviderFieldsDifferIgnoresProbeFields) {
  const auto mhPrior = baseHost();
  auto mhNew = mhPrior;
  mhNew.sIssuer = "Other CA";
  mhNew.status = HostStatus::Expired;
  EXPECT_FALSE(core::providerFieldsDiffer(mhPrior, mhNew));

  mhNew.sComment = "moved";
  EXPECT_TRUE(core::providerFieldsDiffer(mhPrior, mhNew));
}
