// =============================================================================
// orchestrator_test.cpp
// =============================================================================
// Integration tests for tradecore::Orchestrator: real ingestors, decision
// loop, risk manager, coordinator and SimulatedOrderGateway, fed by a
// scripted market data source.
//
// Validates:
//   - A 5% rise with heavy volume produces exactly one momentum order, and
//     the position limit blocks every later one
//   - Execution reports surface as OrderCompletedEvent
//   - No gateway traffic after stop()
//   - start()/stop() are idempotent and the engine is restartable
//   - registerStrategy() is refused while running
//   - Duplicate symbols get a single ingestor
//   - A strategy raising InvariantViolation faults the decision loop
//   - A fill for a submit that timed out or was cut short by stop() still
//     reaches the position ledger
//   - Event subscribers may query the engine while stop() is joining
//   - A failed market data feed makes the engine unhealthy
// =============================================================================

#include "tradecore/common/invariant_violation.hpp"
#include "tradecore/engine/orchestrator.hpp"
#include "tradecore/events/event_types.hpp"
#include "tradecore/execution/simulated_order_gateway.hpp"
#include "tradecore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

using tradecore::domain::OrderBookSnapshot;
using tradecore::domain::PriceSample;
using tradecore::domain::TradingSignal;

// Plays a fixed price path per symbol, then goes quiet (nullopt). Books are
// quoted one cent around the last price handed out. Clearing `feed_up`
// reports the feed as failed.
class ScriptedSource final : public tradecore::IMarketDataSource {
 public:
  ScriptedSource(std::vector<double> path, double volume)
      : path_(std::move(path)), volume_(volume) {}

  std::optional<PriceSample> getPrice(const std::string& symbol) override {
    std::lock_guard lock(mutex_);
    std::size_t& next = cursor_[symbol];
    if (next >= path_.size()) {
      return std::nullopt;
    }
    PriceSample sample;
    sample.symbol = symbol;
    sample.price = path_[next++];
    sample.volume = volume_;
    sample.timestamp = std::chrono::system_clock::now();
    return sample;
  }

  bool healthy() const override { return feed_up.load(); }

  std::atomic<bool> feed_up{true};

  std::optional<OrderBookSnapshot> getOrderBook(
      const std::string& symbol) override {
    std::lock_guard lock(mutex_);
    const std::size_t next = cursor_[symbol];
    const double last = path_[next == 0 ? 0 : next - 1];
    OrderBookSnapshot book;
    book.symbol = symbol;
    book.bids.push_back({last - 0.01, 10.0});
    book.asks.push_back({last + 0.01, 10.0});
    book.timestamp = std::chrono::system_clock::now();
    return book;
  }

 private:
  const std::vector<double> path_;
  const double volume_;
  std::mutex mutex_;
  std::map<std::string, std::size_t> cursor_;
};

// Buys one unit at the last price on every evaluation.
class AlwaysBuy final : public tradecore::IStrategy {
 public:
  std::optional<TradingSignal> analyze(
      const std::vector<PriceSample>& window,
      const OrderBookSnapshot&) const override {
    TradingSignal signal;
    signal.symbol = window.back().symbol;
    signal.side = tradecore::domain::Side::Buy;
    signal.confidence = 1.0;
    signal.target_price = window.back().price;
    signal.quantity = 1.0;
    return signal;
  }

  std::string name() const override { return "AlwaysBuy"; }
};

// Buys one unit once, then stays silent.
class BuyOnce final : public tradecore::IStrategy {
 public:
  std::optional<TradingSignal> analyze(
      const std::vector<PriceSample>& window,
      const OrderBookSnapshot& book) const override {
    if (fired_.exchange(true)) {
      return std::nullopt;
    }
    return AlwaysBuy{}.analyze(window, book);
  }

  std::string name() const override { return "BuyOnce"; }

 private:
  mutable std::atomic<bool> fired_{false};
};

class Corrupted final : public tradecore::IStrategy {
 public:
  std::optional<TradingSignal> analyze(
      const std::vector<PriceSample>&,
      const OrderBookSnapshot&) const override {
    throw tradecore::InvariantViolation("strategy state corrupted");
  }

  std::string name() const override { return "Corrupted"; }
};

std::vector<double> risingPath() {
  // 10.00 → 10.50 in 0.05 steps: +5% over the window.
  std::vector<double> path;
  for (int i = 0; i <= 10; ++i) {
    path.push_back(10.0 + 0.05 * i);
  }
  return path;
}

std::vector<double> flatPath(std::size_t n) {
  return std::vector<double>(n, 10.0);
}

tradecore::EngineConfig testConfig() {
  tradecore::EngineConfig config;
  config.symbols = {"BTC/USD"};
  config.risk.max_position_size = 150.0;
  config.momentum.lookback_period = 10;
  config.momentum.threshold = 0.02;
  config.momentum.quantity = 100.0;
  config.momentum.min_average_volume = 1000.0;
  config.mean_reversion.enabled = false;
  config.ingest_interval = 1ms;
  config.decision_interval = 1ms;
  config.min_samples = 10;
  config.gateway_timeout = 500ms;
  return config;
}

template <typename Pred>
bool waitFor(Pred done, std::chrono::milliseconds limit = 3000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

tradecore::SimulatedGatewayConfig instantFills() {
  tradecore::SimulatedGatewayConfig config;
  config.latency = 0ms;
  return config;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override { gateway->start(); }
  void TearDown() override { gateway->stop(); }

  tradecore::SimulationTimeProvider clock{1'700'000'000'000};
  std::shared_ptr<tradecore::SimulatedOrderGateway> gateway =
      std::make_shared<tradecore::SimulatedOrderGateway>(clock,
                                                         instantFills());
};

// -----------------------------------------------------------------------------
// 1. End-to-end: rising prices → one Buy of 100, position +100, later
//    signals rejected by the 150 position limit.
// Why: the ledger has no entry for the symbol until the first accepted
//      order, so that order passes and the second (200 > 150) cannot.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, RisingPriceProducesSingleMomentumOrder) {
  auto source = std::make_shared<ScriptedSource>(risingPath(), 5000.0);
  tradecore::Orchestrator engine(testConfig(), source, gateway, clock);

  std::atomic<int> submitted{0};
  std::atomic<int> rejected{0};
  std::atomic<int> completed{0};
  std::mutex mutex;
  std::vector<tradecore::domain::Order> submitted_orders;

  auto& bus = engine.eventBus();
  bus.subscribe<tradecore::OrderSubmittedEvent>(
      [&](const tradecore::OrderSubmittedEvent& e) {
        std::lock_guard lock(mutex);
        submitted_orders.push_back(e.order);
        ++submitted;
      });
  bus.subscribe<tradecore::RiskRejectEvent>(
      [&rejected](const tradecore::RiskRejectEvent& e) {
        EXPECT_EQ(e.reason, tradecore::RejectReason::PositionLimit);
        ++rejected;
      });
  bus.subscribe<tradecore::OrderCompletedEvent>(
      [&completed](const tradecore::OrderCompletedEvent& e) {
        EXPECT_EQ(e.order.status, tradecore::domain::OrderStatus::Filled);
        ++completed;
      });

  ASSERT_TRUE(engine.start());
  EXPECT_TRUE(waitFor([&] {
    return submitted.load() >= 1 && completed.load() >= 1 &&
           rejected.load() >= 1;
  }));
  engine.stop();

  EXPECT_EQ(submitted.load(), 1);
  ASSERT_EQ(submitted_orders.size(), 1u);
  const auto& order = submitted_orders.front();
  EXPECT_EQ(order.strategy, "MomentumStrategy");
  EXPECT_EQ(order.symbol, "BTC/USD");
  EXPECT_EQ(order.side, tradecore::domain::Side::Buy);
  EXPECT_DOUBLE_EQ(order.quantity, 100.0);

  auto position = engine.riskManager().position("BTC/USD");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->quantity, 100.0);
  EXPECT_DOUBLE_EQ(position->average_price, order.reference_price);

  ASSERT_NE(engine.decisionLoop(), nullptr);
  EXPECT_EQ(engine.decisionLoop()->submitted(), 1u);
  EXPECT_GE(engine.decisionLoop()->rejected(), 1u);
  EXPECT_EQ(gateway->submitCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. After stop() returns, the gateway sees no further submissions.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, StopHaltsGatewayTraffic) {
  auto config = testConfig();
  config.momentum.enabled = false;
  config.risk.max_position_size = 1e9;
  auto source = std::make_shared<ScriptedSource>(flatPath(20), 5000.0);
  tradecore::Orchestrator engine(config, source, gateway, clock);
  engine.registerStrategy(std::make_unique<AlwaysBuy>());

  ASSERT_TRUE(engine.start());
  ASSERT_TRUE(waitFor([this] { return gateway->submitCount() >= 3; }));
  engine.stop();

  const auto at_stop = gateway->submitCount();
  std::this_thread::sleep_for(50ms);

  EXPECT_EQ(gateway->submitCount(), at_stop);
  EXPECT_FALSE(engine.isRunning());
  for (const auto& status : engine.loopStatuses()) {
    EXPECT_FALSE(status.running) << status.name;
  }
}

// -----------------------------------------------------------------------------
// 3. start() twice returns false the second time; stop() twice is harmless;
//    a stopped engine starts again.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, LifecycleIsIdempotentAndRestartable) {
  auto source = std::make_shared<ScriptedSource>(flatPath(5), 5000.0);
  tradecore::Orchestrator engine(testConfig(), source, gateway, clock);

  EXPECT_EQ(engine.state(), tradecore::Orchestrator::State::Stopped);
  EXPECT_TRUE(engine.loopStatuses().empty());
  EXPECT_FALSE(engine.healthy());

  EXPECT_TRUE(engine.start());
  EXPECT_FALSE(engine.start());
  EXPECT_TRUE(engine.isRunning());
  EXPECT_TRUE(engine.healthy());

  engine.stop();
  engine.stop();
  EXPECT_EQ(engine.state(), tradecore::Orchestrator::State::Stopped);
  EXPECT_FALSE(engine.healthy());
  EXPECT_EQ(engine.loopStatuses().size(), 2u);

  EXPECT_TRUE(engine.start({"ETH/USD"}));
  EXPECT_TRUE(engine.healthy());
  ASSERT_NE(engine.decisionLoop(), nullptr);
  EXPECT_EQ(engine.decisionLoop()->symbols(),
            (std::vector<std::string>{"ETH/USD"}));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. The registry is frozen while running.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, RegisterStrategyRefusedWhileRunning) {
  auto source = std::make_shared<ScriptedSource>(flatPath(5), 5000.0);
  tradecore::Orchestrator engine(testConfig(), source, gateway, clock);
  EXPECT_EQ(engine.strategies().names(),
            (std::vector<std::string>{"MomentumStrategy"}));

  ASSERT_TRUE(engine.start());
  EXPECT_THROW(engine.registerStrategy(std::make_unique<AlwaysBuy>()),
               std::logic_error);
  engine.stop();

  EXPECT_NO_THROW(engine.registerStrategy(std::make_unique<AlwaysBuy>()));
  EXPECT_EQ(engine.strategies().size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Duplicate symbols collapse; empty input is refused and leaves the
//    engine stopped.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, SymbolListIsDeduplicatedAndValidated) {
  auto source = std::make_shared<ScriptedSource>(flatPath(5), 5000.0);
  tradecore::Orchestrator engine(testConfig(), source, gateway, clock);

  EXPECT_THROW(engine.start(std::vector<std::string>{}),
               std::invalid_argument);
  EXPECT_THROW(engine.start({"BTC/USD", ""}), std::invalid_argument);
  EXPECT_FALSE(engine.isRunning());

  ASSERT_TRUE(engine.start({"BTC/USD", "ETH/USD", "BTC/USD"}));
  auto statuses = engine.loopStatuses();
  engine.stop();

  ASSERT_EQ(statuses.size(), 3u);
  EXPECT_EQ(statuses[0].name, "DecisionLoop");
  EXPECT_EQ(statuses[1].name, "MarketDataIngestor:BTC/USD");
  EXPECT_EQ(statuses[2].name, "MarketDataIngestor:ETH/USD");
}

// -----------------------------------------------------------------------------
// 6. InvariantViolation in a strategy faults the decision loop, publishes a
//    LoopFaultEvent and makes the engine unhealthy.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, InvariantViolationFaultsDecisionLoop) {
  auto config = testConfig();
  config.momentum.enabled = false;
  auto source = std::make_shared<ScriptedSource>(flatPath(20), 5000.0);
  tradecore::Orchestrator engine(config, source, gateway, clock);
  engine.registerStrategy(std::make_unique<Corrupted>());

  std::atomic<bool> faulted{false};
  std::mutex mutex;
  std::string fault_loop;
  engine.eventBus().subscribe<tradecore::LoopFaultEvent>(
      [&](const tradecore::LoopFaultEvent& e) {
        std::lock_guard lock(mutex);
        fault_loop = e.loop_name;
        faulted.store(true);
      });

  ASSERT_TRUE(engine.start());
  ASSERT_TRUE(waitFor([&faulted] { return faulted.load(); }));
  EXPECT_TRUE(waitFor([&engine] { return !engine.healthy(); }));

  auto statuses = engine.loopStatuses();
  engine.stop();

  {
    std::lock_guard lock(mutex);
    EXPECT_EQ(fault_loop, "DecisionLoop");
  }
  ASSERT_FALSE(statuses.empty());
  EXPECT_TRUE(statuses[0].faulted);
  EXPECT_EQ(statuses[0].fault_reason, "strategy state corrupted");
  EXPECT_EQ(gateway->submitCount(), 0u);
}

// -----------------------------------------------------------------------------
// 7. The venue answers after the submit timed out and fills the order: the
//    late fill is booked into the ledger by the decision loop.
// How: 60ms venue latency against a 20ms gateway timeout.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, LateFillAfterSubmitTimeoutReachesLedger) {
  tradecore::SimulatedGatewayConfig slow;
  slow.latency = 60ms;
  auto slow_venue =
      std::make_shared<tradecore::SimulatedOrderGateway>(clock, slow);
  slow_venue->start();

  auto config = testConfig();
  config.momentum.enabled = false;
  config.gateway_timeout = 20ms;
  auto source = std::make_shared<ScriptedSource>(flatPath(20), 5000.0);
  tradecore::Orchestrator engine(config, source, slow_venue, clock);
  engine.registerStrategy(std::make_unique<BuyOnce>());

  std::mutex mutex;
  std::vector<std::string> failures;
  std::atomic<int> position_updates{0};
  engine.eventBus().subscribe<tradecore::OrderFailedEvent>(
      [&](const tradecore::OrderFailedEvent& e) {
        std::lock_guard lock(mutex);
        failures.push_back(e.reason);
      });
  engine.eventBus().subscribe<tradecore::PositionUpdateEvent>(
      [&position_updates](const tradecore::PositionUpdateEvent&) {
        ++position_updates;
      });

  ASSERT_TRUE(engine.start());
  EXPECT_TRUE(waitFor([&engine] {
    return engine.riskManager().position("BTC/USD").has_value();
  }));
  engine.stop();
  slow_venue->stop();

  {
    std::lock_guard lock(mutex);
    EXPECT_EQ(failures, (std::vector<std::string>{"timeout"}));
  }
  auto position = engine.riskManager().position("BTC/USD");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->quantity, 1.0);
  EXPECT_DOUBLE_EQ(position->average_price, 10.0);
  EXPECT_EQ(position_updates.load(), 1);
  EXPECT_EQ(engine.decisionLoop()->lateFills(), 1u);
  EXPECT_EQ(engine.orderCoordinator().unresolvedCount(), 0u);
  EXPECT_EQ(engine.orderCoordinator().pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 8. stop() during an in-flight submit abandons the wait, but waits for the
//    venue to settle the order and books the fill before returning.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, StopBooksFillOfAbandonedSubmit) {
  tradecore::SimulatedGatewayConfig slow;
  slow.latency = 200ms;
  auto slow_venue =
      std::make_shared<tradecore::SimulatedOrderGateway>(clock, slow);
  slow_venue->start();

  auto config = testConfig();
  config.momentum.enabled = false;
  config.gateway_timeout = 2000ms;
  auto source = std::make_shared<ScriptedSource>(flatPath(20), 5000.0);
  tradecore::Orchestrator engine(config, source, slow_venue, clock);
  engine.registerStrategy(std::make_unique<BuyOnce>());

  std::atomic<bool> signalled{false};
  std::mutex mutex;
  std::vector<std::string> failures;
  engine.eventBus().subscribe<tradecore::SignalEvent>(
      [&signalled](const tradecore::SignalEvent&) { signalled.store(true); });
  engine.eventBus().subscribe<tradecore::OrderFailedEvent>(
      [&](const tradecore::OrderFailedEvent& e) {
        std::lock_guard lock(mutex);
        failures.push_back(e.reason);
      });

  ASSERT_TRUE(engine.start());
  ASSERT_TRUE(waitFor([&signalled] { return signalled.load(); }));
  std::this_thread::sleep_for(20ms);

  const auto begin = std::chrono::steady_clock::now();
  engine.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  slow_venue->stop();

  {
    std::lock_guard lock(mutex);
    EXPECT_EQ(failures, (std::vector<std::string>{"abandoned"}));
  }
  auto position = engine.riskManager().position("BTC/USD");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->quantity, 1.0);
  EXPECT_EQ(engine.orderCoordinator().unresolvedCount(), 0u);
  EXPECT_LT(elapsed, 2000ms);
}

// -----------------------------------------------------------------------------
// 9. A subscriber on the decision-loop thread that calls state(), healthy()
//    and loopStatuses() while stop() is joining that thread.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, SubscribersMayQueryEngineDuringStop) {
  auto config = testConfig();
  config.momentum.enabled = false;
  auto source = std::make_shared<ScriptedSource>(flatPath(20), 5000.0);
  tradecore::Orchestrator engine(config, source, gateway, clock);
  engine.registerStrategy(std::make_unique<AlwaysBuy>());

  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  engine.eventBus().subscribe<tradecore::SignalEvent>(
      [&](const tradecore::SignalEvent&) {
        if (entered.exchange(true)) {
          return;
        }
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(engine.state(), tradecore::Orchestrator::State::Running);
        EXPECT_FALSE(engine.loopStatuses().empty());
        static_cast<void>(engine.healthy());
        finished.store(true);
      });

  ASSERT_TRUE(engine.start());
  ASSERT_TRUE(waitFor([&entered] { return entered.load(); }));
  engine.stop();

  EXPECT_TRUE(finished.load());
  EXPECT_EQ(engine.state(), tradecore::Orchestrator::State::Stopped);
}

// -----------------------------------------------------------------------------
// 10. A dead feed turns healthy() false while every loop keeps running.
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, FailedFeedMakesEngineUnhealthy) {
  auto source = std::make_shared<ScriptedSource>(flatPath(5), 5000.0);
  tradecore::Orchestrator engine(testConfig(), source, gateway, clock);

  ASSERT_TRUE(engine.start());
  EXPECT_TRUE(engine.healthy());

  source->feed_up.store(false);
  EXPECT_FALSE(engine.healthy());
  for (const auto& status : engine.loopStatuses()) {
    EXPECT_TRUE(status.running) << status.name;
  }

  source->feed_up.store(true);
  EXPECT_TRUE(engine.healthy());
  engine.stop();
}

TEST(OrchestratorConstructionTest, RejectsMissingCollaborators) {
  tradecore::SimulationTimeProvider clock;
  auto gateway = std::make_shared<tradecore::SimulatedOrderGateway>(clock);
  auto source = std::make_shared<ScriptedSource>(flatPath(1), 0.0);

  EXPECT_THROW(tradecore::Orchestrator(testConfig(), nullptr, gateway, clock),
               std::invalid_argument);
  EXPECT_THROW(tradecore::Orchestrator(testConfig(), source, nullptr, clock),
               std::invalid_argument);
}
