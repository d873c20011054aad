#include "gtest/gtest.h"
#include "warden/utils/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

using warden::utils::Scheduler;
using namespace std::chrono_literals;

TEST(SchedulerTest, PostRuns) {
  Scheduler scheduler(2);
  std::promise<int> done;
  auto future = done.get_future();
  EXPECT_NE(scheduler.Post([&done] { done.set_value(42); }), 0u);
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(future.get(), 42);
}

TEST(SchedulerTest, DelayedTaskWaits) {
  Scheduler scheduler(1);
  std::promise<void> done;
  auto future = done.get_future();
  auto start = std::chrono::steady_clock::now();
  scheduler.ScheduleAfter(100ms, [&done] { done.set_value(); });
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST(SchedulerTest, EarlierDeadlineRunsFirst) {
  Scheduler scheduler(1);
  std::atomic<int> order{0};
  int late = 0, early = 0;
  std::promise<void> done;
  auto future = done.get_future();
  scheduler.ScheduleAfter(150ms, [&] { late = ++order; done.set_value(); });
  scheduler.ScheduleAfter(20ms, [&] { early = ++order; });
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(early, 1);
  EXPECT_EQ(late, 2);
}

TEST(SchedulerTest, CancelPreventsRun) {
  Scheduler scheduler(1);
  std::atomic<bool> ran{false};
  auto id = scheduler.ScheduleAfter(100ms, [&ran] { ran = true; });
  EXPECT_EQ(scheduler.PendingCount(), 1u);
  EXPECT_TRUE(scheduler.Cancel(id));
  EXPECT_FALSE(scheduler.Cancel(id));
  EXPECT_EQ(scheduler.PendingCount(), 0u);
  std::this_thread::sleep_for(200ms);
  EXPECT_FALSE(ran);
}

TEST(SchedulerTest, ThrowingTaskDoesNotKillWorker) {
  Scheduler scheduler(1);
  scheduler.Post([] { throw std::runtime_error("boom"); });
  std::promise<void> done;
  auto future = done.get_future();
  scheduler.Post([&done] { done.set_value(); });
  EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST(SchedulerTest, ShutdownRejectsAndDiscards) {
  Scheduler scheduler(0);
  std::atomic<bool> ran{false};
  scheduler.ScheduleAfter(10s, [&ran] { ran = true; });
  scheduler.Shutdown();
  EXPECT_EQ(scheduler.PendingCount(), 0u);
  EXPECT_EQ(scheduler.Post([] {}), 0u);
  scheduler.Shutdown();
  EXPECT_FALSE(ran);
}

}  // namespace
