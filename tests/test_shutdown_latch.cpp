#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "application/services/ShutdownLatch.hpp"

using hookline::proxy::application::services::ShutdownLatch;
using hookline::proxy::application::services::ShutdownReason;
using namespace std::chrono_literals;

TEST(ShutdownLatch, FirstReasonWinsAndActionRunsOnce) {
  ShutdownLatch latch;
  int runs = 0;
  latch.arm([&](ShutdownReason) { ++runs; });

  latch.fire(ShutdownReason::server_closed);
  latch.fire(ShutdownReason::stop_requested);

  EXPECT_EQ(runs, 1);
  EXPECT_EQ(latch.reason(), ShutdownReason::server_closed);
  EXPECT_EQ(latch.wait(), ShutdownReason::server_closed);
}

TEST(ShutdownLatch, ArmAfterFireRunsImmediately) {
  ShutdownLatch latch;
  latch.fire(ShutdownReason::process_exited);

  ShutdownReason seen = ShutdownReason::fatal_error;
  latch.arm([&](ShutdownReason r) { seen = r; });
  EXPECT_EQ(seen, ShutdownReason::process_exited);
}

TEST(ShutdownLatch, BlockedActionDoesNotHoldTheLatch) {
  ShutdownLatch latch;
  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();
  latch.arm(
      [&](ShutdownReason)
      {
        entered.set_value();
        released.wait();
      });

  std::thread firing([&] { latch.fire(ShutdownReason::client_closed); });
  entered.get_future().wait();

  // Both return while the action is still blocked.
  auto other = std::async(std::launch::async,
                          [&]
                          {
                            latch.fire(ShutdownReason::stop_requested);
                            return latch.reason();
                          });
  ASSERT_EQ(other.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(other.get(), ShutdownReason::client_closed);
  EXPECT_EQ(latch.wait(), ShutdownReason::client_closed);

  release.set_value();
  firing.join();
}

TEST(ShutdownLatch, DisarmWaitsForRunningAction) {
  ShutdownLatch latch;
  std::promise<void> entered;
  std::atomic<bool> finished{false};
  latch.arm(
      [&](ShutdownReason)
      {
        entered.set_value();
        std::this_thread::sleep_for(100ms);
        finished = true;
      });

  std::thread firing([&] { latch.fire(ShutdownReason::stop_requested); });
  entered.get_future().wait();
  latch.disarm();
  EXPECT_TRUE(finished);
  firing.join();
}

TEST(ShutdownLatch, WaitBlocksUntilFired) {
  ShutdownLatch latch;
  auto waiter = std::async(std::launch::async, [&] { return latch.wait(); });
  EXPECT_EQ(waiter.wait_for(50ms), std::future_status::timeout);

  latch.fire(ShutdownReason::fatal_error);
  ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(waiter.get(), ShutdownReason::fatal_error);
}
