#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using certmon::core::ThreadPool;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, SubmitReturnsResult) {
  ThreadPool tp(2);
  auto fut = tp.submit([] { return 42; });
  EXPECT_EQ(fut.get(), 42);
}

TEST(ThreadPoolTest, ExceptionLandsInFuture) {
  ThreadPool tp(1);
  auto fut = tp.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitBlocksUntilAllTasksFinish) {
  ThreadPool tp(3);
  std::atomic<int> iDone{0};
  for (int i = 0; i < 12; ++i) {
    tp.submit([&iDone] {
      std::this_thread::sleep_for(10ms);
      iDone.fetch_add(1);
    });
  }
  tp.wait();
  EXPECT_EQ(iDone.load(), 12);
}

TEST(ThreadPoolTest, NeverRunsMoreTasksThanItsWidth) {
  ThreadPool tp(3);
  std::atomic<int> iActive{0};
  std::atomic<int> iPeak{0};
  for (int i = 0; i < 15; ++i) {
    tp.submit([&] {
      const int iNow = iActive.fetch_add(1) + 1;
      int iSeen = iPeak.load();
      while (iNow > iSeen && !iPeak.compare_exchange_weak(iSeen, iNow)) {
      }
      std::this_thread::sleep_for(20ms);
      iActive.fetch_sub(1);
    });
  }
  tp.wait();
  EXPECT_LE(iPeak.load(), 3);
  EXPECT_GE(iPeak.load(), 1);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
  ThreadPool tp(1);
  tp.shutdown();
  tp.shutdown();
  EXPECT_THROW(tp.submit([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, DefaultSizeIsPositive) {
  ThreadPool tp;
  EXPECT_GE(tp.size(), 1);
}
