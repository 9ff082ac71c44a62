#pragma once

#include "tradecore/concurrent/order_id_generator.hpp"
#include "tradecore/concurrent/polling_loop_thread.hpp"
#include "tradecore/config/engine_config.hpp"
#include "tradecore/engine/decision_loop.hpp"
#include "tradecore/eventbus/event_bus.hpp"
#include "tradecore/execution/i_order_gateway.hpp"
#include "tradecore/execution/order_coordinator.hpp"
#include "tradecore/history/price_history_store.hpp"
#include "tradecore/market_data/i_market_data_source.hpp"
#include "tradecore/market_data/market_data_ingestor.hpp"
#include "tradecore/risk/risk_manager.hpp"
#include "tradecore/strategy/i_strategy.hpp"
#include "tradecore/strategy/strategy_registry.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// Orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the trading core and its loop threads, and exposes the
//         start/stop lifecycle to main() and tests.
//
// @details
// Lifecycle:
//
//   Stopped --start(symbols)--> Running --stop()--> Stopped   (restartable)
//
// Thread layout while Running:
//
//   MarketDataIngestor:<symbol>   one per distinct symbol, records samples
//   DecisionLoop                  strategies → risk → order coordinator
//   gateway worker (external)     execution reports → complete() + event
//   caller thread                 start(), stop(), accessors
//
// All loops share one RunFlag. stop() clears it, then joins the decision
// loop before the ingestors so no order is built from a half-stopped feed.
// It then waits up to gateway_timeout for unresolved orders (submits cut
// short by the stop) to settle, booking any late fill, and finally detaches
// the gateway's execution-report handler. Once stop() returns no loop thread
// is alive and no new gateway call can start.
//
// The joins run without the lifecycle mutex, so EventBus subscribers on the
// loop threads may call state(), healthy() and loopStatuses() during
// shutdown. They must not call start() or stop().
//
// Loop objects are kept after stop() so loopStatuses() still reports their
// final counters; the next start() replaces them.
//
// Ownership:
//   Orchestrator
//    ├── history_          (shared_ptr<PriceHistoryStore>, shared with loops)
//    ├── registry_         (StrategyRegistry, value member)
//    ├── risk_             (RiskManager, value member)
//    ├── coordinator_      (OrderCoordinator, value member)
//    ├── bus_              (EventBus, value member)
//    ├── ids_              (OrderIdGenerator, value member)
//    ├── ingestors_        (unique_ptr<MarketDataIngestor> per symbol)
//    └── decision_loop_    (unique_ptr<DecisionLoop>)
//   The market data source and the order gateway are shared with the
//   caller. The ITimeProvider must outlive the Orchestrator.
// -----------------------------------------------------------------------------
class Orchestrator {
 public:
  enum class State { Stopped, Running };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Builds the core components from `config` and registers the
  //         enabled default strategies (momentum first, then mean reversion).
  //
  // @details
  // No thread is spawned. Throws std::invalid_argument on a null source or
  // gateway, and propagates component constructor errors (invalid risk
  // parameters, lookbacks, capacities).
  // -------------------------------------------------------------------------
  Orchestrator(EngineConfig config,
               std::shared_ptr<IMarketDataSource> source,
               std::shared_ptr<IOrderGateway> gateway,
               const ITimeProvider& clock);

  // Destructor calls stop().
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;

  // Appends a strategy to the registry. Throws std::logic_error while
  // Running and std::invalid_argument on a null pointer.
  void registerStrategy(std::unique_ptr<IStrategy> strategy);

  // -------------------------------------------------------------------------
  // start(symbols)
  // -------------------------------------------------------------------------
  //
  // @brief  Spawns one ingestor per distinct symbol, then the decision loop.
  //
  // @return false if already Running.
  //
  // @details
  // Duplicate symbols are collapsed, keeping first-seen order. Throws
  // std::invalid_argument on an empty list or an empty symbol; the
  // Orchestrator is left Stopped in that case.
  //
  // Thread-safety: Serialized with stop() and registerStrategy().
  // Side-effects:  Installs the gateway's execution-report handler.
  // -------------------------------------------------------------------------
  bool start(const std::vector<std::string>& symbols);

  // Starts with the configured symbol list.
  bool start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Clears the run flag and joins every loop thread.
  //
  // Thread-safety: Serialized with start(). Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  State state() const;
  bool isRunning() const { return state() == State::Running; }

  // Running, the market data source reports healthy, and no loop has
  // faulted or exited on its own.
  bool healthy() const;

  // Decision loop first, then ingestors in start order. Empty before the
  // first start().
  std::vector<LoopStatus> loopStatuses() const;

  const PriceHistoryStore& history() const { return *history_; }
  RiskManager& riskManager() { return risk_; }
  const RiskManager& riskManager() const { return risk_; }
  OrderCoordinator& orderCoordinator() { return coordinator_; }
  const OrderCoordinator& orderCoordinator() const { return coordinator_; }
  EventBus& eventBus() { return bus_; }
  const StrategyRegistry& strategies() const { return registry_; }
  const EngineConfig& config() const { return config_; }

  // Null before the first start().
  const DecisionLoop* decisionLoop() const { return decision_loop_.get(); }

 private:
  void onExecutionReport(const ExecutionReport& report);
  void onLoopFault(const std::string& loop_name, const std::string& reason);
  void reconcileAfterStop();

  const EngineConfig config_;
  std::shared_ptr<IMarketDataSource> source_;
  std::shared_ptr<IOrderGateway> gateway_;
  const ITimeProvider& clock_;

  std::shared_ptr<PriceHistoryStore> history_;
  StrategyRegistry registry_;
  RiskManager risk_;
  OrderCoordinator coordinator_;
  EventBus bus_;
  OrderIdGenerator ids_;

  RunFlag run_flag_;

  // Serializes start() and stop(); held across the joins.
  std::mutex transition_mutex_;
  mutable std::mutex lifecycle_mutex_;
  State state_{State::Stopped};

  // Destroyed before the components above, which they reference.
  std::vector<std::unique_ptr<MarketDataIngestor>> ingestors_;
  std::unique_ptr<DecisionLoop> decision_loop_;
};

const char* toString(Orchestrator::State state);

}  // namespace tradecore
