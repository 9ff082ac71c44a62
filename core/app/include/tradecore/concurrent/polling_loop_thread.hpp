#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tradecore {

// -----------------------------------------------------------------------------
// RunFlag
// -----------------------------------------------------------------------------
// Engine-wide "keep running" flag. The Orchestrator creates one and hands
// the same shared_ptr to every loop; clearing it asks all of them to stop at
// their next check. Shared ownership means a loop can never observe a
// dangling flag, whatever the destruction order.
// -----------------------------------------------------------------------------
using RunFlag = std::shared_ptr<std::atomic<bool>>;

inline RunFlag makeRunFlag(bool initial = false) {
  return std::make_shared<std::atomic<bool>>(initial);
}

// -----------------------------------------------------------------------------
// LoopStatus: health snapshot of one PollingLoopThread
// -----------------------------------------------------------------------------
struct LoopStatus {
  std::string name;
  bool running{false};
  std::uint64_t iterations{0};
  std::uint64_t errors{0};       // Iterations that threw std::exception
  bool faulted{false};           // Stopped by an InvariantViolation
  std::string fault_reason;
};

// -----------------------------------------------------------------------------
// PollingLoopThread
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that calls a tick function at a fixed
//         interval until stopped.
//
// @details
// Every MarketDataIngestor and the DecisionLoop run on one of these. Between
// ticks the worker sleeps on a condition variable rather than
// std::this_thread::sleep_for, so stop() wakes it immediately instead of
// waiting out the interval.
//
// The worker keeps running while BOTH its own running_ flag and the shared
// RunFlag are true. The shared flag lets the Orchestrator halt every loop
// with a single store before joining them one by one.
//
// Failure containment per iteration:
//   - std::exception      → logged to std::cerr, errors counter incremented,
//                           loop continues with the next poll.
//   - InvariantViolation  → loop is marked faulted, the fault handler is
//                           invoked, and the worker exits. The thread stays
//                           joinable until stop() is called.
//
// Thread model:
//   start(), stop() and status() may be called from any thread except the
//   worker itself. The tick function and fault handler run on the worker.
//
// Ownership:
//   Owned by the component that defines the tick (ingestor, decision loop).
//   Holds a copy of the RunFlag shared_ptr.
// -----------------------------------------------------------------------------
class PollingLoopThread {
 public:
  using Tick = std::function<void()>;
  using FaultHandler =
      std::function<void(const std::string& loop_name,
                         const std::string& reason)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  name      Used in log lines and LoopStatus.
  // @param  interval  Delay between the end of one tick and the next.
  // @param  tick      Work performed once per iteration.
  // @param  run_flag  Shared engine flag; must not be null.
  //
  // Throws std::invalid_argument on a null flag, empty tick or non-positive
  // interval.
  // -------------------------------------------------------------------------
  PollingLoopThread(std::string name, std::chrono::milliseconds interval,
                    Tick tick, RunFlag run_flag);

  ~PollingLoopThread();

  PollingLoopThread(const PollingLoopThread&) = delete;
  PollingLoopThread& operator=(const PollingLoopThread&) = delete;
  PollingLoopThread(PollingLoopThread&&) = delete;
  PollingLoopThread& operator=(PollingLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // setFaultHandler(handler)
  // -------------------------------------------------------------------------
  // @brief  Callback invoked on the worker thread when an InvariantViolation
  //         faults the loop. Must be set before start().
  // -------------------------------------------------------------------------
  void setFaultHandler(FaultHandler handler);

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Spawns the worker. No-op if a worker thread already exists
  //         (including a faulted one that has not been stopped yet).
  //
  // @details
  // Resets counters and fault state. The worker exits immediately if the
  // shared RunFlag is false, so the owner must raise it first.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Asks the worker to exit, wakes it, and joins it.
  //
  // @details
  // Returns only after the worker thread has finished, so no tick is running
  // once stop() returns. An in-flight tick is allowed to complete. The shared
  // RunFlag is left untouched. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }
  const std::string& name() const { return name_; }
  LoopStatus status() const;

 private:
  void run();
  bool shouldRun() const;

  const std::string name_;
  const std::chrono::milliseconds interval_;
  Tick tick_;
  RunFlag run_flag_;
  FaultHandler on_fault_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> iterations_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::atomic<bool> faulted_{false};

  mutable std::mutex fault_mutex_;  // Protects fault_reason_
  std::string fault_reason_;

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::thread thread_;
};

}  // namespace tradecore
