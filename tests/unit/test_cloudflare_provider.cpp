#include "providers/CloudflareProvider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "common/Errors.hpp"
#include "fakes/Fakes.hpp"
#include "providers/ProviderFactory.hpp"

using certmon::common::ProviderError;
using certmon::providers::CloudflareProvider;
using certmon::test::FakeHttpClient;

class CloudflareProviderTest : public ::testing::Test {
 protected:
  void SetUp() override { _spHttp = std::make_shared<FakeHttpClient>(); }

  CloudflareProvider makeProvider() {
    return CloudflareProvider("https://api.cloudflare.test/client/v4/", "cf-token", _spHttp);
  }

  std::shared_ptr<FakeHttpClient> _spHttp;
};

TEST_F(CloudflareProviderTest, ListZonesFollowsPagination) {
  _spHttp->queue(200, R"({"success":true,"result":[{"id":"z1","name":"example.com","status":"active"}],
                         "result_info":{"page":1,"total_pages":2}})");
  _spHttp->queue(200, R"({"success":true,"result":[{"id":"z2","name":"example.org","status":"pending"}],
                         "result_info":{"page":2,"total_pages":2}})");
  auto cfp = makeProvider();

  const auto vZones = cfp.listZones();

  ASSERT_EQ(vZones.size(), 2u);
  EXPECT_EQ(vZones[1].sName, "example.org");
  EXPECT_EQ(vZones[1].sStatus, "pending");

  const auto vRequests = _spHttp->requests();
  ASSERT_EQ(vRequests.size(), 2u);
  EXPECT_EQ(vRequests[0].sUrl, "https://api.cloudflare.test/client/v4/zones?page=1&per_page=50");
  EXPECT_EQ(vRequests[1].sUrl, "https://api.cloudflare.test/client/v4/zones?page=2&per_page=50");
  bool bAuth = false;
  for (const auto& [sName, sValue] : vRequests[0].vHeaders) {
    bAuth = bAuth || (sName == "Authorization" && sValue == "Bearer cf-token");
  }
  EXPECT_TRUE(bAuth);
}

TEST_F(CloudflareProviderTest, ListRecordsParsesFields) {
  _spHttp->queue(200, R"({"success":true,"result":[
      {"id":"r1","zone_name":"example.com","name":"a.example.com","type":"CNAME",
       "content":"lb.example.net","proxied":true,"comment":null},
      {"id":"r2","zone_id":"z1","zone_name":"example.com","name":"b.example.com","type":"A",
       "content":"192.0.2.1","proxied":false,"comment":"edge"}],
      "result_info":{"page":3,"total_pages":4}})");
  auto cfp = makeProvider();

  const auto rp = cfp.listRecords("z1", 3, 100);

  EXPECT_EQ(rp.iPage, 3);
  EXPECT_EQ(rp.iTotalPages, 4);
  ASSERT_EQ(rp.vRecords.size(), 2u);
  EXPECT_EQ(rp.vRecords[0].sZoneId, "z1");
  EXPECT_EQ(rp.vRecords[0].sType, "CNAME");
  EXPECT_TRUE(rp.vRecords[0].bProxied);
  EXPECT_TRUE(rp.vRecords[0].sComment.empty());
  EXPECT_EQ(rp.vRecords[1].sComment, "edge");
  EXPECT_EQ(_spHttp->requests()[0].sUrl,
            "https://api.cloudflare.test/client/v4/zones/z1/dns_records?page=3&per_page=100");
}

TEST_F(CloudflareProviderTest, ApiErrorCarriesMessage) {
  _spHttp->queue(403, R"({"success":false,"errors":[{"code":9109,"message":"Invalid access token"}]})");
  auto cfp = makeProvider();

  try {
    cfp.listZones();
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_EQ(e._sErrorCode, "provider_api_error");
    EXPECT_NE(std::string(e.what()).find("Invalid access token"), std::string::npos);
  }
}

TEST_F(CloudflareProviderTest, UnsuccessfulEnvelopeIsError) {
  _spHttp->queue(200, R"({"success":false,"errors":[]})");
  auto cfp = makeProvider();
  EXPECT_THROW(cfp.getZone("z1"), ProviderError);
}

TEST_F(CloudflareProviderTest, NonJsonBodyIsError) {
  _spHttp->queue(502, "<html>Bad gateway</html>");
  auto cfp = makeProvider();

  try {
    cfp.getRecord("z1", "r1");
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_EQ(e._sErrorCode, "provider_bad_response");
  }
}

TEST_F(CloudflareProviderTest, TransportFailureIsProviderError) {
  _spHttp->bThrowConnectionError = true;
  auto cfp = makeProvider();

  try {
    cfp.listZones();
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_EQ(e._sErrorCode, "provider_unreachable");
  }
}

TEST_F(CloudflareProviderTest, FactoryBuildsCloudflare) {
  auto spProvider = certmon::providers::ProviderFactory::create(
      "cloudflare", "https://api.cloudflare.test/client/v4", "t", _spHttp);
  EXPECT_EQ(spProvider->name(), "cloudflare");
  EXPECT_THROW(certmon::providers::ProviderFactory::create("bind", "", "", _spHttp),
               certmon::common::ValidationError);
}
