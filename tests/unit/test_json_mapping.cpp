#include "api/JsonMapping.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"

using namespace certmon::api;
using certmon::common::HostStatus;
using certmon::common::MonitoredHost;
using certmon::common::ValidationError;

TEST(JsonMappingTest, HostUsesColumnNamesAndNullTimes) {
  MonitoredHost mh;
  mh.iId = 7;
  mh.sHostname = "www.example.com";
  mh.oNotAfter = certmon::common::makeUtc(2027, 3, 1);
  mh.vSans = {"www.example.com"};
  mh.status = HostStatus::ConnectionError;

  const auto j = toJson(mh);

  EXPECT_EQ(j["id"], 7);
  EXPECT_EQ(j["hostname"], "www.example.com");
  EXPECT_EQ(j["status"], "connection_error");
  EXPECT_EQ(j["not_after"], "2027-03-01T00:00:00Z");
  EXPECT_TRUE(j["not_before"].is_null());
  EXPECT_EQ(j["sans"].size(), 1u);
}

TEST(JsonMappingTest, HostPageEnvelope) {
  certmon::common::HostPage hp;
  hp.vHosts.resize(2);
  hp.iTotal = 41;
  certmon::common::HostFilter hf;
  hf.iPage = 3;

  const auto j = toJson(hp, hf);

  EXPECT_EQ(j["data"].size(), 2u);
  EXPECT_EQ(j["total"], 41);
  EXPECT_EQ(j["page"], 3);
  EXPECT_EQ(j["page_size"], 20);
}

TEST(JsonMappingTest, ManualHostDefaults) {
  const auto mh = manualHostFromJson({{"hostname", "legacy.example.net"}});

  EXPECT_EQ(mh.sHostname, "legacy.example.net");
  EXPECT_EQ(mh.iPort, 443);
  EXPECT_TRUE(mh.isManual());
  EXPECT_EQ(mh.sRecordType, "manual");
  EXPECT_EQ(mh.status, HostStatus::Pending);
}

TEST(JsonMappingTest, ManualHostValidation) {
  EXPECT_THROW(manualHostFromJson(nlohmann::json::array()), ValidationError);
  EXPECT_THROW(manualHostFromJson({{"port", 443}}), ValidationError);
  EXPECT_THROW(manualHostFromJson({{"hostname", "a.example.com"}, {"port", 70000}}),
               ValidationError);
}

TEST(JsonMappingTest, IdsFromJson) {
  EXPECT_EQ(idsFromJson({{"ids", {3, 9}}}, "ids"), (std::vector<int64_t>{3, 9}));
  EXPECT_THROW(idsFromJson({{"ids", nlohmann::json::array()}}, "ids"), ValidationError);
  EXPECT_THROW(idsFromJson({{"ids", {1, -2}}}, "ids"), ValidationError);
  EXPECT_THROW(idsFromJson({{"ids", {"1"}}}, "ids"), ValidationError);
  EXPECT_THROW(idsFromJson({{"other", {1}}}, "ids"), ValidationError);
}

TEST(JsonMappingTest, CsvQuotesAndBom) {
  MonitoredHost mh;
  mh.sHostname = "www.example.com";
  mh.sIssuer = "Example CA, Inc \"R3\"";
  mh.oNotAfter = certmon::common::makeUtc(2027, 3, 1);
  mh.iDaysRemaining = 12;
  mh.status = HostStatus::Active;
  mh.sZoneName = "example.com";

  const std::string sCsv = toCsv({mh});

  EXPECT_EQ(sCsv.rfind("\xEF\xBB\xBF" "Domain,Issuer,", 0), 0u);
  EXPECT_NE(sCsv.find("www.example.com,\"Example CA, Inc \"\"R3\"\"\",2027-03-01,12,active,false,"
                      "example.com\r\n"),
            std::string::npos);
}
