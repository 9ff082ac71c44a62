// =============================================================================
// polling_loop_thread_test.cpp
// =============================================================================
// Unit tests for tradecore::PollingLoopThread.
//
// Validates:
//   - The tick runs repeatedly until stop()
//   - std::exception from a tick is counted and the loop keeps going
//   - InvariantViolation faults the loop and calls the fault handler
//   - stop() wakes a long interval immediately
//   - Clearing the shared RunFlag halts the worker
//   - Constructor argument validation
// =============================================================================

#include "tradecore/common/invariant_violation.hpp"
#include "tradecore/concurrent/polling_loop_thread.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Polls `done` for up to `limit`. Returns its final value.
template <typename Pred>
bool waitFor(Pred done, std::chrono::milliseconds limit = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

}  // namespace

class PollingLoopThreadTest : public ::testing::Test {
 protected:
  tradecore::RunFlag flag = tradecore::makeRunFlag(true);
};

// -----------------------------------------------------------------------------
// 1. The tick is called repeatedly; stop() joins and reports not running.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, TicksUntilStopped) {
  std::atomic<int> ticks{0};
  tradecore::PollingLoopThread loop("Ticker", 1ms, [&ticks] { ++ticks; },
                                    flag);

  loop.start();
  EXPECT_TRUE(waitFor([&ticks] { return ticks.load() >= 5; }));
  loop.stop();

  const int after_stop = ticks.load();
  std::this_thread::sleep_for(20ms);

  EXPECT_EQ(ticks.load(), after_stop);
  EXPECT_FALSE(loop.isRunning());

  auto status = loop.status();
  EXPECT_EQ(status.name, "Ticker");
  EXPECT_GE(status.iterations, 5u);
  EXPECT_EQ(status.errors, 0u);
  EXPECT_FALSE(status.faulted);
}

// -----------------------------------------------------------------------------
// 2. A throwing tick is logged and counted; the loop survives.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, OrdinaryExceptionsAreContained) {
  std::atomic<int> ticks{0};
  tradecore::PollingLoopThread loop(
      "Flaky", 1ms,
      [&ticks] {
        if (++ticks % 2 == 0) {
          throw std::runtime_error("transient");
        }
      },
      flag);

  loop.start();
  EXPECT_TRUE(waitFor([&ticks] { return ticks.load() >= 6; }));
  EXPECT_TRUE(loop.isRunning());
  loop.stop();

  auto status = loop.status();
  EXPECT_GE(status.errors, 3u);
  EXPECT_FALSE(status.faulted);
}

// -----------------------------------------------------------------------------
// 3. InvariantViolation stops the loop and reaches the fault handler.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, InvariantViolationFaultsLoop) {
  std::atomic<int> ticks{0};
  std::atomic<bool> handled{false};
  std::string handled_name;
  std::string handled_reason;

  tradecore::PollingLoopThread loop(
      "Strict", 1ms,
      [&ticks] {
        if (++ticks == 3) {
          throw tradecore::InvariantViolation("ledger corrupted");
        }
      },
      flag);
  loop.setFaultHandler([&](const std::string& name, const std::string& why) {
    handled_name = name;
    handled_reason = why;
    handled.store(true);
  });

  loop.start();
  ASSERT_TRUE(waitFor([&handled] { return handled.load(); }));
  ASSERT_TRUE(waitFor([&loop] { return !loop.isRunning(); }));
  loop.stop();

  EXPECT_EQ(ticks.load(), 3);
  EXPECT_EQ(handled_name, "Strict");
  EXPECT_EQ(handled_reason, "ledger corrupted");

  auto status = loop.status();
  EXPECT_TRUE(status.faulted);
  EXPECT_EQ(status.fault_reason, "ledger corrupted");
  EXPECT_FALSE(status.running);
}

// -----------------------------------------------------------------------------
// 4. stop() does not wait out the interval.
// How: a one-minute interval; stop() must return well before that.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, StopWakesSleepingWorker) {
  std::atomic<int> ticks{0};
  tradecore::PollingLoopThread loop("Slow", 60s, [&ticks] { ++ticks; }, flag);

  loop.start();
  ASSERT_TRUE(waitFor([&ticks] { return ticks.load() == 1; }));

  const auto begin = std::chrono::steady_clock::now();
  loop.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(ticks.load(), 1);
}

// -----------------------------------------------------------------------------
// 5. Clearing the shared flag ends the worker on its own.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, ClearingRunFlagStopsWorker) {
  std::atomic<int> ticks{0};
  tradecore::PollingLoopThread loop("Shared", 1ms, [&ticks] { ++ticks; },
                                    flag);

  loop.start();
  ASSERT_TRUE(waitFor([&ticks] { return ticks.load() >= 1; }));

  flag->store(false);
  EXPECT_TRUE(waitFor([&loop] { return !loop.isRunning(); }));
  loop.stop();
}

// -----------------------------------------------------------------------------
// 6. A loop started with the flag already down exits without ticking.
// -----------------------------------------------------------------------------
TEST_F(PollingLoopThreadTest, LoweredFlagPreventsTicks) {
  flag->store(false);
  std::atomic<int> ticks{0};
  tradecore::PollingLoopThread loop("Idle", 1ms, [&ticks] { ++ticks; }, flag);

  loop.start();
  EXPECT_TRUE(waitFor([&loop] { return !loop.isRunning(); }));
  loop.stop();

  EXPECT_EQ(ticks.load(), 0);
}

TEST(PollingLoopThreadConstructionTest, RejectsBadArguments) {
  auto flag = tradecore::makeRunFlag(true);
  auto noop = [] {};

  EXPECT_THROW(tradecore::PollingLoopThread("x", 1ms, noop, nullptr),
               std::invalid_argument);
  EXPECT_THROW(tradecore::PollingLoopThread("x", 1ms, {}, flag),
               std::invalid_argument);
  EXPECT_THROW(tradecore::PollingLoopThread("x", 0ms, noop, flag),
               std::invalid_argument);
}
