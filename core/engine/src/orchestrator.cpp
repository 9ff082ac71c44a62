#include "tradecore/engine/orchestrator.hpp"

#include "tradecore/events/event_types.hpp"
#include "tradecore/strategy/mean_reversion_strategy.hpp"
#include "tradecore/strategy/momentum_strategy.hpp"
#include "tradecore/time/time_utils.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace tradecore {

namespace {

// Poll period while stop() waits for unresolved orders to settle.
constexpr auto kSettlePoll = std::chrono::milliseconds(5);

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components, register the default strategies
// -----------------------------------------------------------------------------
Orchestrator::Orchestrator(EngineConfig config,
                           std::shared_ptr<IMarketDataSource> source,
                           std::shared_ptr<IOrderGateway> gateway,
                           const ITimeProvider& clock)
    : config_(std::move(config)),
      source_(std::move(source)),
      gateway_(std::move(gateway)),
      clock_(clock),
      history_(std::make_shared<PriceHistoryStore>(config_.history_capacity)),
      risk_(config_.risk),
      coordinator_(gateway_, config_.gateway_timeout),
      run_flag_(makeRunFlag(false)) {
  if (!source_) {
    throw std::invalid_argument("Orchestrator requires a market data source");
  }

  if (config_.momentum.enabled) {
    registry_.add(std::make_unique<MomentumStrategy>(
        config_.momentum.lookback_period, config_.momentum.threshold,
        config_.momentum.quantity, config_.momentum.min_average_volume));
  }
  if (config_.mean_reversion.enabled) {
    registry_.add(std::make_unique<MeanReversionStrategy>(
        config_.mean_reversion.lookback_period,
        config_.mean_reversion.threshold, config_.mean_reversion.quantity));
  }
}

Orchestrator::~Orchestrator() { stop(); }

void Orchestrator::registerStrategy(std::unique_ptr<IStrategy> strategy) {
  std::lock_guard lock(lifecycle_mutex_);
  if (state_ == State::Running) {
    throw std::logic_error(
        "Orchestrator: strategies can only be registered while stopped");
  }
  registry_.add(std::move(strategy));
}

// -----------------------------------------------------------------------------
// start(): build loops, raise the run flag, spawn threads
// -----------------------------------------------------------------------------
bool Orchestrator::start(const std::vector<std::string>& symbols) {
  std::lock_guard transition(transition_mutex_);
  std::lock_guard lock(lifecycle_mutex_);
  if (state_ == State::Running) {
    return false;
  }

  std::vector<std::string> distinct;
  std::unordered_set<std::string> seen;
  for (const auto& symbol : symbols) {
    if (symbol.empty()) {
      throw std::invalid_argument("Orchestrator: empty symbol");
    }
    if (seen.insert(symbol).second) {
      distinct.push_back(symbol);
    }
  }
  if (distinct.empty()) {
    throw std::invalid_argument("Orchestrator: no symbols to trade");
  }

  // ---  1) Build every loop first; a constructor failure leaves us Stopped --
  std::vector<std::unique_ptr<MarketDataIngestor>> ingestors;
  ingestors.reserve(distinct.size());
  for (const auto& symbol : distinct) {
    ingestors.push_back(std::make_unique<MarketDataIngestor>(
        symbol, source_, history_, config_.ingest_interval, run_flag_));
  }

  DecisionLoop::Dependencies deps;
  deps.history = history_;
  deps.source = source_;
  deps.registry = &registry_;
  deps.risk = &risk_;
  deps.coordinator = &coordinator_;
  deps.bus = &bus_;
  deps.ids = &ids_;
  deps.clock = &clock_;
  auto decision_loop = std::make_unique<DecisionLoop>(
      distinct, std::move(deps), config_.decision_interval,
      config_.min_samples, run_flag_);

  const PollingLoopThread::FaultHandler on_fault =
      [this](const std::string& name, const std::string& reason) {
        onLoopFault(name, reason);
      };
  for (auto& ingestor : ingestors) {
    ingestor->setFaultHandler(on_fault);
  }
  decision_loop->setFaultHandler(on_fault);

  // Previous run's loops were joined by stop(); release them now.
  decision_loop_.reset();
  ingestors_ = std::move(ingestors);
  decision_loop_ = std::move(decision_loop);

  // ---  2) Raise the shared flag before any thread checks it --------------
  run_flag_->store(true);

  // ---  3) Execution feedback must be live before the first submission -----
  gateway_->setExecutionReportHandler(
      [this](const ExecutionReport& report) { onExecutionReport(report); });

  // ---  4) Ingestors, then the decision loop --------------------------------
  for (auto& ingestor : ingestors_) {
    ingestor->start();
  }
  decision_loop_->start();

  state_ = State::Running;

  std::cout << "[Orchestrator] started: " << ingestors_.size()
            << " ingestor(s), " << registry_.size() << " strategy(ies).\n";
  return true;
}

bool Orchestrator::start() { return start(config_.symbols); }

// -----------------------------------------------------------------------------
// stop(): flag down, join decision loop, join ingestors, settle unresolved
//         orders, detach handler
// -----------------------------------------------------------------------------
void Orchestrator::stop() {
  std::lock_guard transition(transition_mutex_);
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (state_ == State::Stopped) {
      return;
    }
    run_flag_->store(false);
  }

  // Joined without lifecycle_mutex_: event subscribers running on the loop
  // threads may still call state(), healthy() or loopStatuses().
  decision_loop_->stop();
  for (auto& ingestor : ingestors_) {
    ingestor->stop();
  }

  // An abandoned submit may still be filled at the venue. Give the venue up
  // to one gateway timeout to settle it while reports can still arrive.
  const auto deadline =
      std::chrono::steady_clock::now() + config_.gateway_timeout;
  while (coordinator_.unresolvedCount() > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    reconcileAfterStop();
    std::this_thread::sleep_for(kSettlePoll);
  }

  // Blocks until a report handler already running on the gateway thread
  // returns, so `this` is never used after stop().
  gateway_->setExecutionReportHandler(nullptr);
  reconcileAfterStop();

  {
    std::lock_guard lock(lifecycle_mutex_);
    state_ = State::Stopped;
  }

  std::cout << "[Orchestrator] stopped. All loops joined ("
            << coordinator_.pendingCount() << " order(s) still pending, "
            << coordinator_.unresolvedCount() << " unresolved).\n";
}

void Orchestrator::reconcileAfterStop() {
  try {
    decision_loop_->reconcileOrders();
  } catch (const std::exception& e) {
    std::cerr << "[Orchestrator] reconciliation after stop failed: "
              << e.what() << "\n";
  }
}

Orchestrator::State Orchestrator::state() const {
  std::lock_guard lock(lifecycle_mutex_);
  return state_;
}

bool Orchestrator::healthy() const {
  std::lock_guard lock(lifecycle_mutex_);
  if (state_ != State::Running || !decision_loop_ || !source_->healthy()) {
    return false;
  }

  const LoopStatus decision = decision_loop_->status();
  if (!decision.running || decision.faulted) {
    return false;
  }
  for (const auto& ingestor : ingestors_) {
    const LoopStatus s = ingestor->status();
    if (!s.running || s.faulted) {
      return false;
    }
  }
  return true;
}

std::vector<LoopStatus> Orchestrator::loopStatuses() const {
  std::lock_guard lock(lifecycle_mutex_);
  std::vector<LoopStatus> out;
  if (decision_loop_) {
    out.push_back(decision_loop_->status());
  }
  for (const auto& ingestor : ingestors_) {
    out.push_back(ingestor->status());
  }
  return out;
}

// -----------------------------------------------------------------------------
// onExecutionReport(): runs on the gateway's thread
// -----------------------------------------------------------------------------
void Orchestrator::onExecutionReport(const ExecutionReport& report) {
  if (!domain::isTerminal(report.status)) {
    return;
  }

  std::optional<domain::Order> order = coordinator_.complete(report);
  if (!order) {
    return;
  }

  std::cout << "[Orchestrator] order " << order->id << " "
            << domain::toString(order->status) << " "
            << report.filled_quantity << " @ " << report.fill_price << "\n";
  bus_.publish(OrderCompletedEvent{*order, report.fill_price,
                                   report.timestamp});
}

void Orchestrator::onLoopFault(const std::string& loop_name,
                               const std::string& reason) {
  std::cerr << "[Orchestrator] loop " << loop_name << " faulted: " << reason
            << "\n";
  bus_.publish(
      LoopFaultEvent{loop_name, reason, ms_to_timestamp(clock_.now_ms())});
}

const char* toString(Orchestrator::State state) {
  switch (state) {
    case Orchestrator::State::Stopped:
      return "Stopped";
    case Orchestrator::State::Running:
      return "Running";
  }
  return "Unknown";
}

}  // namespace tradecore
