#include "notify/Notifier.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"
#include "fakes/Fakes.hpp"
#include "notify/AlertChannel.hpp"
#include "notify/DeliveryQueue.hpp"

using namespace certmon;
using certmon::common::EventType;
using certmon::common::HostStatus;
using certmon::notify::Notifier;
using certmon::notify::NotifierConfig;
using certmon::test::FakeHostRepository;
using certmon::test::FakeHttpClient;
using certmon::test::FakeSettingsRepository;
using namespace std::chrono_literals;

namespace {

/// Poll until the fake has seen iCount requests or two seconds pass.
bool waitForRequests(FakeHttpClient& hc, size_t uCount) {
  const auto tpEnd = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < tpEnd) {
    if (hc.requests().size() >= uCount) return true;
    std::this_thread::sleep_for(10ms);
  }
  return hc.requests().size() >= uCount;
}

std::string webhookText(const common::HttpRequest& hreq) {
  return nlohmann::json::parse(hreq.sBody).at("text").get<std::string>();
}

common::MonitoredHost expiringHost(int iDays) {
  common::MonitoredHost mh;
  mh.iId = 7;
  mh.sHostname = "a.example.com";
  mh.status = HostStatus::Active;
  mh.oNotAfter = std::chrono::system_clock::now() + std::chrono::hours(24 * iDays + 1);
  mh.iDaysRemaining = iDays;
  mh.bIsMatch = true;
  mh.sResolvedRecord = "192.0.2.1";
  return mh;
}

}  // namespace

class NotifierTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _spHttp = std::make_shared<FakeHttpClient>();
    _spSettings = std::make_shared<FakeSettingsRepository>();
    _spHosts = std::make_shared<FakeHostRepository>();
    _spSettings->als.bWebhookEnabled = true;
    _spSettings->als.sWebhookUrl = "https://hooks.example.net/alert";
    _ncfg.iThresholdDays = 30;
    _ncfg.durCooldown = std::chrono::hours(24);
    _ncfg.uQueueCapacity = 16;
    _ncfg.durSendInterval = 10ms;
  }

  std::unique_ptr<Notifier> makeNotifier() {
    auto upNtf = std::make_unique<Notifier>(_ncfg, _spSettings, _spHosts, _spHttp);
    upNtf->reloadSettings();
    return upNtf;
  }

  NotifierConfig _ncfg;
  std::shared_ptr<FakeHttpClient> _spHttp;
  std::shared_ptr<FakeSettingsRepository> _spSettings;
  std::shared_ptr<FakeHostRepository> _spHosts;
};

// ── Rule evaluation ─────────────────────────────────────────────────────────

TEST(NotifierRulesTest, HealthyHostDoesNotNotify) {
  EXPECT_FALSE(Notifier::evaluate(expiringHost(60), 30).bNotify);
}

TEST(NotifierRulesTest, ExpiringAndExpiredCertificates) {
  const auto adSoon = Notifier::evaluate(expiringHost(10), 30);
  ASSERT_TRUE(adSoon.bNotify);
  EXPECT_EQ(adSoon.vReasons.front(), "SSL certificate expires in 10 days");

  auto mhExpired = expiringHost(0);
  mhExpired.iDaysRemaining = -2;
  const auto adExpired = Notifier::evaluate(mhExpired, 30);
  ASSERT_TRUE(adExpired.bNotify);
  EXPECT_EQ(adExpired.vReasons.front(), "SSL certificate expired");
}

TEST(NotifierRulesTest, IgnoredHostNeverNotifies) {
  auto mh = expiringHost(1);
  mh.bIgnored = true;
  EXPECT_FALSE(Notifier::evaluate(mh, 30).bNotify);
}

TEST(NotifierRulesTest, UnknownCertificateOnlyAlertsOnConnectionError) {
  common::MonitoredHost mh;
  mh.sHostname = "a.example.com";
  mh.status = HostStatus::Pending;
  EXPECT_FALSE(Notifier::evaluate(mh, 30).bNotify);

  mh.status = HostStatus::ConnectionError;
  mh.sErrorMessage = "Connection refused";
  const auto ad = Notifier::evaluate(mh, 30);
  ASSERT_TRUE(ad.bNotify);
  EXPECT_EQ(ad.vReasons.front(), "❌ Connection refused");
}

TEST(NotifierRulesTest, RegistrationExpiryAndMismatch) {
  auto mh = expiringHost(90);
  mh.oDomainExpiry = std::chrono::system_clock::now() + std::chrono::hours(24 * 5);
  mh.iDomainDaysLeft = 5;
  mh.bIsMatch = false;

  const auto ad = Notifier::evaluate(mh, 30);

  ASSERT_TRUE(ad.bNotify);
  ASSERT_EQ(ad.vReasons.size(), 2u);
  EXPECT_EQ(ad.vReasons[0], "Domain registration expires in 5 days");
  EXPECT_EQ(ad.vReasons[1], "❌ Hostname mismatch");
}

TEST(NotifierRulesTest, UnresolvableAloneDoesNotNotify) {
  auto mh = expiringHost(90);
  mh.status = HostStatus::Unresolvable;
  mh.bIsMatch = false;

  const auto ad = Notifier::evaluate(mh, 30);

  EXPECT_FALSE(ad.bNotify);
  ASSERT_EQ(ad.vReasons.size(), 1u);
  EXPECT_EQ(ad.vReasons[0], "❌ Domain unresolvable");
}

// ── Expiry alerts ───────────────────────────────────────────────────────────

TEST_F(NotifierTest, ExpiryAlertIsSentOncePerCooldown) {
  _spSettings->als.bNotifyOnExpiry = true;
  auto mh = expiringHost(10);
  mh.iId = _spHosts->seed(mh);
  auto upNtf = makeNotifier();

  upNtf->checkAndNotify(mh);
  upNtf->checkAndNotify(mh);

  ASSERT_TRUE(waitForRequests(*_spHttp, 1));
  std::this_thread::sleep_for(100ms);
  const auto vRequests = _spHttp->requests();
  ASSERT_EQ(vRequests.size(), 1u);
  EXPECT_EQ(vRequests[0].sUrl, "https://hooks.example.net/alert");
  EXPECT_EQ(vRequests[0].sMethod, "POST");
  const auto sText = webhookText(vRequests[0]);
  EXPECT_NE(sText.find("a.example.com"), std::string::npos);
  EXPECT_NE(sText.find("SSL certificate expires in 10 days"), std::string::npos);

  const auto oStored = _spHosts->findById(mh.iId);
  ASSERT_TRUE(oStored.has_value());
  EXPECT_TRUE(oStored->oLastAlertAt.has_value());
}

TEST_F(NotifierTest, StoredAlertTimeSuppressesAlert) {
  _spSettings->als.bNotifyOnExpiry = true;
  auto mh = expiringHost(10);
  mh.oLastAlertAt = std::chrono::system_clock::now() - 1h;
  auto upNtf = makeNotifier();

  upNtf->checkAndNotify(mh);

  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(_spHttp->requests().empty());
}

TEST_F(NotifierTest, ExpiryToggleOffSendsNothing) {
  _spSettings->als.bNotifyOnExpiry = false;
  auto upNtf = makeNotifier();

  upNtf->checkAndNotify(expiringHost(3));

  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(_spHttp->requests().empty());
}

TEST_F(NotifierTest, ReasonIsAppendedWhenTemplateOmitsIt) {
  _spSettings->als.bNotifyOnExpiry = true;
  _spSettings->als.sExpiryTemplate = "Check {{.Domain}} ({{.Days}}d)";
  auto mh = expiringHost(10);
  mh.bIsMatch = false;
  auto upNtf = makeNotifier();

  upNtf->checkAndNotify(mh);

  ASSERT_TRUE(waitForRequests(*_spHttp, 1));
  const auto sText = webhookText(_spHttp->requests()[0]);
  EXPECT_EQ(sText.rfind("Check a.example.com (10d)", 0), 0u);
  EXPECT_NE(sText.find("\nReason: SSL certificate expires in 10 days, ❌ Hostname mismatch"),
            std::string::npos);
  EXPECT_NE(sText.find("does not match the hostname"), std::string::npos);
}

// ── Lifecycle events ────────────────────────────────────────────────────────

TEST_F(NotifierTest, DisabledEventIsDropped) {
  _spSettings->als.bNotifyOnAdd = false;
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::Add, "a.example.com", "details");

  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(_spHttp->requests().empty());
}

TEST_F(NotifierTest, EnabledEventUsesDefaultTemplate) {
  _spSettings->als.bNotifyOnDelete = true;
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::Delete, "b.example.com", "gone");

  ASSERT_TRUE(waitForRequests(*_spHttp, 1));
  EXPECT_EQ(webhookText(_spHttp->requests()[0]),
            "🗑 [Domain deleted]\nTarget: b.example.com\nDetails: gone");
}

TEST_F(NotifierTest, CustomTemplateIsRendered) {
  _spSettings->als.bNotifyOnZoneAdd = true;
  _spSettings->als.sZoneAddTemplate = "{{.Action}}: {{.Domain}}";
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::ZoneAdd, "example.com", "Subdomains: 3");

  ASSERT_TRUE(waitForRequests(*_spHttp, 1));
  EXPECT_EQ(webhookText(_spHttp->requests()[0]), "Zone added: example.com");
}

TEST_F(NotifierTest, BrokenTemplateDropsMessage) {
  _spSettings->als.bNotifyOnUpdate = true;
  _spSettings->als.sUpdateTemplate = "{{.Days}}";
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::Update, "a.example.com", "Target changed");

  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(_spHttp->requests().empty());
}

TEST_F(NotifierTest, NoChannelEnabledSendsNothing) {
  _spSettings->als.bWebhookEnabled = false;
  _spSettings->als.bNotifyOnAdd = true;
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::Add, "a.example.com", "details");

  std::this_thread::sleep_for(100ms);
  EXPECT_TRUE(_spHttp->requests().empty());
}

TEST_F(NotifierTest, SyncSummaryRendersCounts) {
  _spSettings->als.bNotifyOnSyncFinish = true;
  auto upNtf = makeNotifier();

  notify::TaskSummaryData tsd;
  tsd.iAdded = 2;
  tsd.iDeleted = 1;
  tsd.sDuration = "1.5s";
  upNtf->notifyTaskFinish(EventType::SyncFinish, tsd);

  ASSERT_TRUE(waitForRequests(*_spHttp, 1));
  const auto sText = webhookText(_spHttp->requests()[0]);
  EXPECT_NE(sText.find("Added: 2"), std::string::npos);
  EXPECT_NE(sText.find("Deleted: 1"), std::string::npos);
  EXPECT_NE(sText.find("Duration: 1.5s"), std::string::npos);
}

TEST_F(NotifierTest, EachEnabledChannelReceivesTheMessage) {
  _spSettings->als.bTelegramEnabled = true;
  _spSettings->als.sTelegramBotToken = "123:abc";
  _spSettings->als.sTelegramChatId = "-100";
  _spSettings->als.bNotifyOnRenew = true;
  auto upNtf = makeNotifier();

  upNtf->notifyOperation(EventType::Renew, "a.example.com", "renewed");

  ASSERT_TRUE(waitForRequests(*_spHttp, 2));
  bool bTelegram = false;
  for (const auto& hreq : _spHttp->requests()) {
    if (hreq.sUrl == "https://api.telegram.org/bot123:abc/sendMessage") {
      bTelegram = true;
      const auto jBody = nlohmann::json::parse(hreq.sBody);
      EXPECT_EQ(jBody.at("chat_id"), "-100");
      EXPECT_EQ(jBody.at("parse_mode"), "HTML");
    }
  }
  EXPECT_TRUE(bTelegram);
}

// ── Settings and test messages ──────────────────────────────────────────────

TEST_F(NotifierTest, ReloadKeepsPreviousSettingsOnFailure) {
  auto upNtf = makeNotifier();
  ASSERT_TRUE(upNtf->settings().bWebhookEnabled);

  _spSettings->bFail = true;
  upNtf->reloadSettings();

  EXPECT_TRUE(upNtf->settings().bWebhookEnabled);
}

TEST_F(NotifierTest, TestMessageWithoutChannelThrows) {
  auto upNtf = makeNotifier();
  try {
    upNtf->sendTestMessage(common::AlertSettings{});
    FAIL() << "expected DeliveryError";
  } catch (const common::DeliveryError& e) {
    EXPECT_EQ(e._sErrorCode, "no_channel");
  }
}

TEST_F(NotifierTest, TestMessageIsSynchronous) {
  auto upNtf = makeNotifier();
  common::AlertSettings als;
  als.bWebhookEnabled = true;
  als.sWebhookUrl = "https://other.example.net/hook";
  als.sWebhookToken = "secret";

  upNtf->sendTestMessage(als);

  const auto vRequests = _spHttp->requests();
  ASSERT_EQ(vRequests.size(), 1u);
  EXPECT_EQ(vRequests[0].sUrl, "https://other.example.net/hook");
  bool bBearer = false;
  for (const auto& [sName, sValue] : vRequests[0].vHeaders) {
    bBearer = bBearer || (sName == "Authorization" && sValue == "Bearer secret");
  }
  EXPECT_TRUE(bBearer);
  EXPECT_TRUE(vRequests[0].sBasicUser.empty());
}

TEST_F(NotifierTest, TestMessageRejectedByChannelThrows) {
  auto upNtf = makeNotifier();
  _spHttp->queue(500, "oops");

  EXPECT_THROW(upNtf->sendTestMessage(_spSettings->als), common::DeliveryError);
}

TEST_F(NotifierTest, TestMessageTransportFailureThrows) {
  auto upNtf = makeNotifier();
  _spHttp->bThrowConnectionError = true;

  EXPECT_THROW(upNtf->sendTestMessage(_spSettings->als), common::DeliveryError);
}

// ── Channels and queues ─────────────────────────────────────────────────────

TEST(AlertChannelTest, WebhookFallsBackToBasicAuth) {
  auto spHttp = std::make_shared<FakeHttpClient>();
  notify::WebhookChannel whc(spHttp, "https://hooks.example.net/a", "user", "pw", "");

  whc.send("hello");

  const auto vRequests = spHttp->requests();
  ASSERT_EQ(vRequests.size(), 1u);
  EXPECT_EQ(vRequests[0].sBasicUser, "user");
  EXPECT_EQ(vRequests[0].sBasicPassword, "pw");
  EXPECT_EQ(webhookText(vRequests[0]), "hello");
}

TEST(AlertChannelTest, IncompleteChannelsAreNotBuilt) {
  auto spHttp = std::make_shared<FakeHttpClient>();
  common::AlertSettings als;
  als.bTelegramEnabled = true;
  als.sTelegramBotToken = "123:abc";
  als.bWebhookEnabled = true;

  EXPECT_TRUE(notify::buildChannels(als, spHttp).empty());
}

TEST(DeliveryQueueTest, FullQueueRejectsWithoutBlocking) {
  auto spHttp = std::make_shared<FakeHttpClient>();
  auto spChannel = std::make_shared<notify::WebhookChannel>(spHttp, "https://h.example.net/",
                                                            "", "", "");
  notify::DeliveryQueue dq("webhook", 1, 5s);

  int iAccepted = 0;
  for (int i = 0; i < 5; ++i) {
    if (dq.enqueue(notify::DeliveryJob{spChannel, "m" + std::to_string(i)})) ++iAccepted;
  }

  EXPECT_GE(iAccepted, 1);
  EXPECT_LE(iAccepted, 2);
  dq.shutdown();
  EXPECT_FALSE(dq.enqueue(notify::DeliveryJob{spChannel, "late"}));
}
