#pragma once

#include "tradecore/concurrent/order_id_generator.hpp"
#include "tradecore/concurrent/polling_loop_thread.hpp"
#include "tradecore/domain/trading_signal.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/execution/order_coordinator.hpp"
#include "tradecore/history/price_history_store.hpp"
#include "tradecore/market_data/i_market_data_source.hpp"
#include "tradecore/risk/risk_manager.hpp"
#include "tradecore/strategy/strategy_registry.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// DecisionLoop: signals in, risk-checked orders out
// -----------------------------------------------------------------------------
//
// @brief  Periodically evaluates every registered strategy against each
//         symbol's recent price window and routes the resulting signals
//         through risk into the order coordinator.
//
// @details
// One tick (tickOnce) first applies late fills (reconcileOrders), then
// walks the symbols in start order:
//
//   1. skip the symbol until it has at least min_samples recorded samples
//   2. copy its window out of the PriceHistoryStore
//   3. fetch an order book; none means "skip this symbol this tick"
//   4. StrategyRegistry::evaluate() in registration order
//   5. per signal:
//        build a Market order (fresh id, signal side/size, reference price
//        = signal target, timestamp from the ITimeProvider)
//        publish SignalEvent
//        RiskManager::validateAndCommit() with OrderCoordinator::submit()
//        as the submit step
//        publish RiskRejectEvent | OrderFailedEvent |
//                OrderSubmittedEvent + PositionUpdateEvent
//
// The run flag is read before every symbol and every signal, and the submit
// step passes an abandon predicate on the same flag, so after stop() no new
// gateway call starts and an in-flight wait is cut short.
//
// Thread model:
//   tickOnce() runs on the loop's own thread. The collaborators it borrows
//   are internally synchronized. Counters may be read from any thread.
//
// Ownership:
//   Owned by the Orchestrator, which also owns (and outlives) every
//   collaborator passed by reference.
// -----------------------------------------------------------------------------
class DecisionLoop {
 public:
  struct Dependencies {
    std::shared_ptr<PriceHistoryStore> history;
    std::shared_ptr<IMarketDataSource> source;
    const StrategyRegistry* registry{nullptr};
    RiskManager* risk{nullptr};
    OrderCoordinator* coordinator{nullptr};
    EventBus* bus{nullptr};
    OrderIdGenerator* ids{nullptr};
    const ITimeProvider* clock{nullptr};
  };

  // Throws std::invalid_argument if any dependency is missing, the symbol
  // list is empty or min_samples is zero.
  DecisionLoop(std::vector<std::string> symbols, Dependencies deps,
               std::chrono::milliseconds interval, std::size_t min_samples,
               RunFlag run_flag);

  ~DecisionLoop();

  DecisionLoop(const DecisionLoop&) = delete;
  DecisionLoop& operator=(const DecisionLoop&) = delete;
  DecisionLoop(DecisionLoop&&) = delete;
  DecisionLoop& operator=(DecisionLoop&&) = delete;

  void start();
  void stop();

  // One decision pass over every symbol. Public so tests can step it.
  void tickOnce();

  // Books fills the venue reported for orders whose submit had given up
  // (see OrderCoordinator::reconcile) into the RiskManager ledger and
  // publishes a PositionUpdateEvent for each. Also called by
  // Orchestrator::stop() once the loop is joined.
  void reconcileOrders();

  void setFaultHandler(PollingLoopThread::FaultHandler handler);

  LoopStatus status() const { return loop_.status(); }
  const std::vector<std::string>& symbols() const { return symbols_; }

  std::uint64_t signals() const { return signals_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }
  std::uint64_t submitted() const { return submitted_.load(); }
  std::uint64_t failed() const { return failed_.load(); }
  std::uint64_t lateFills() const { return late_fills_.load(); }

 private:
  void handleSignal(const domain::TradingSignal& signal);
  bool stopRequested() const { return !run_flag_->load(); }

  const std::vector<std::string> symbols_;
  const Dependencies deps_;
  const std::size_t min_samples_;
  RunFlag run_flag_;

  std::atomic<std::uint64_t> signals_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> submitted_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> late_fills_{0};

  // Declared last so its thread never sees a partially built loop.
  PollingLoopThread loop_;
};

}  // namespace tradecore
