#include "dal/ConnectionPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using certmon::dal::ConnectionPool;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("CERTMON_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "CERTMON_DB_URL not set, skipping integration test";
    }
  }

  std::string _sDbUrl;
};

TEST_F(ConnectionPoolTest, CreatesPoolOfRequestedSize) {
  ConnectionPool cpPool(_sDbUrl, 3);
  EXPECT_EQ(cpPool.size(), 3);
  EXPECT_EQ(cpPool.available(), 3);
  EXPECT_TRUE(cpPool.healthy());
}

TEST_F(ConnectionPoolTest, ConnectionGuardReturnsOnScopeExit) {
  ConnectionPool cpPool(_sDbUrl, 2);

  {
    auto cg1 = cpPool.checkout();
    auto cg2 = cpPool.checkout();
    EXPECT_EQ(cpPool.available(), 0);

    pqxx::nontransaction ntx(*cg1);
    auto result = ntx.exec("SELECT 1 AS val");
    EXPECT_EQ(result.one_row()[0].as<int>(), 1);
  }
  EXPECT_EQ(cpPool.available(), 2);
}

TEST_F(ConnectionPoolTest, ExhaustedPoolTimesOut) {
  ConnectionPool cpPool(_sDbUrl, 1, std::chrono::seconds(1));
  auto cgHeld = cpPool.checkout();

  EXPECT_THROW(cpPool.checkout(), std::runtime_error);
}

TEST_F(ConnectionPoolTest, ConcurrentCheckoutsFromMultipleThreads) {
  const int iThreadCount = 8;
  ConnectionPool cpPool(_sDbUrl, 4);

  std::vector<std::thread> vThreads;
  std::atomic<int> iSuccessCount{0};

  for (int i = 0; i < iThreadCount; ++i) {
    vThreads.emplace_back([&cpPool, &iSuccessCount]() {
      auto cgConn = cpPool.checkout();
      pqxx::nontransaction ntx(*cgConn);
      auto result = ntx.exec("SELECT 1 AS val");
      if (result.one_row()[0].as<int>() == 1) {
        iSuccessCount.fetch_add(1);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    });
  }

  for (auto& t : vThreads) {
    t.join();
  }

  EXPECT_EQ(iSuccessCount.load(), iThreadCount);
}
