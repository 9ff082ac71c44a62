#include "tradecore/concurrent/polling_loop_thread.hpp"

#include "tradecore/common/invariant_violation.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// Constructor: validate arguments, no thread yet
// -----------------------------------------------------------------------------
PollingLoopThread::PollingLoopThread(std::string name,
                                     std::chrono::milliseconds interval,
                                     Tick tick, RunFlag run_flag)
    : name_(std::move(name)),
      interval_(interval),
      tick_(std::move(tick)),
      run_flag_(std::move(run_flag)) {
  if (!run_flag_) {
    throw std::invalid_argument("PollingLoopThread '" + name_ +
                                "': run flag must not be null");
  }
  if (!tick_) {
    throw std::invalid_argument("PollingLoopThread '" + name_ +
                                "': tick function must not be empty");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("PollingLoopThread '" + name_ +
                                "': interval must be positive");
  }
}

PollingLoopThread::~PollingLoopThread() { stop(); }

void PollingLoopThread::setFaultHandler(FaultHandler handler) {
  on_fault_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// start(): reset counters and spawn the worker
// -----------------------------------------------------------------------------
void PollingLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  iterations_.store(0);
  errors_.store(0);
  faulted_.store(false);
  {
    std::lock_guard lock(fault_mutex_);
    fault_reason_.clear();
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): clear the local flag, wake the worker, join
// -----------------------------------------------------------------------------
void PollingLoopThread::stop() {
  running_.store(false);

  {
    // Taking the lock orders this notify after any in-progress predicate
    // check in run(), so the wakeup cannot be lost.
    std::lock_guard lock(wake_mutex_);
  }
  wake_cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
}

LoopStatus PollingLoopThread::status() const {
  LoopStatus s;
  s.name = name_;
  s.running = running_.load();
  s.iterations = iterations_.load();
  s.errors = errors_.load();
  s.faulted = faulted_.load();
  {
    std::lock_guard lock(fault_mutex_);
    s.fault_reason = fault_reason_;
  }
  return s;
}

bool PollingLoopThread::shouldRun() const {
  return running_.load() && run_flag_->load();
}

// -----------------------------------------------------------------------------
// run(): tick, contain failures, sleep until the next interval or stop()
// -----------------------------------------------------------------------------
void PollingLoopThread::run() {
  while (shouldRun()) {
    iterations_.fetch_add(1);

    try {
      tick_();
    } catch (const InvariantViolation& e) {
      {
        std::lock_guard lock(fault_mutex_);
        fault_reason_ = e.what();
      }
      faulted_.store(true);
      std::cerr << "[" << name_ << "] FATAL: " << e.what()
                << ". Loop stopped.\n";
      if (on_fault_) {
        on_fault_(name_, e.what());
      }
      break;
    } catch (const std::exception& e) {
      errors_.fetch_add(1);
      std::cerr << "[" << name_ << "] iteration failed: " << e.what()
                << "\n";
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, interval_, [this] { return !shouldRun(); });
  }

  running_.store(false);
}

}  // namespace tradecore
