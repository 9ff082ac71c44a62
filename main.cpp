// -----------------------------------------------------------------------------
// tradecore: single executable entry point.
//
//   1) Load the EngineConfig (JSON path from argv[1], built-in defaults when
//      no path is given).
//   2) Pick the market data source: ZeroMQ SUB feed when
//      market_data.endpoint is set, simulated random walk otherwise.
//   3) Start the simulated order gateway.
//   4) Build the Orchestrator, subscribe logging callbacks, start it.
//   5) Run for engine.run_duration_s or until Ctrl-C, then shut down in
//      reverse order.
//
// Thread layout:
//   main thread         → waits on the shutdown flag
//   ingestor threads    → one per symbol
//   decision thread     → strategies, risk, order submission
//   gateway worker      → acks and fills
//   zmq receive thread  → only with a ZeroMQ feed
// -----------------------------------------------------------------------------

#include "tradecore/config/engine_config.hpp"
#include "tradecore/engine/orchestrator.hpp"
#include "tradecore/events/event_types.hpp"
#include "tradecore/execution/simulated_order_gateway.hpp"
#include "tradecore/market_data/simulated_market_data_source.hpp"
#include "tradecore/market_data/zmq_market_data_source.hpp"
#include "tradecore/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {

// The only global: set from the SIGINT handler, polled by main().
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

void subscribeLogging(tradecore::EventBus& bus) {
  using namespace tradecore;

  bus.subscribe<RiskRejectEvent>([](const RiskRejectEvent& e) {
    std::cout << "[Risk] rejected " << domain::toString(e.order.side) << " "
              << e.order.quantity << " " << e.order.symbol << " from "
              << e.order.strategy << ": " << toString(e.reason) << "\n";
  });

  bus.subscribe<OrderSubmittedEvent>([](const OrderSubmittedEvent& e) {
    std::cout << "[Execution] order " << e.order.id << " "
              << domain::toString(e.order.side) << " " << e.order.quantity
              << " " << e.order.symbol << " @ " << e.order.reference_price
              << " stop_loss=" << e.levels.stop_loss
              << " take_profit=" << e.levels.take_profit << "\n";
  });

  bus.subscribe<OrderFailedEvent>([](const OrderFailedEvent& e) {
    std::cout << "[Execution] order " << e.order.id << " failed: "
              << e.reason << "\n";
  });

  bus.subscribe<PositionUpdateEvent>([](const PositionUpdateEvent& e) {
    std::cout << "[Position] symbol=" << e.position.symbol
              << " qty=" << e.position.quantity
              << " avg_price=" << e.position.average_price << "\n";
  });

  bus.subscribe<OrderCompletedEvent>([](const OrderCompletedEvent& e) {
    std::cout << "[Execution] order " << e.order.id << " "
              << domain::toString(e.order.status) << " @ " << e.fill_price
              << "\n";
  });

  bus.subscribe<LoopFaultEvent>([](const LoopFaultEvent& e) {
    std::cerr << "[main] loop " << e.loop_name << " faulted: " << e.reason
              << "\n";
  });
}

}  // namespace

int main(int argc, char** argv) {
  // ---------------------------------------------------------------------------
  // 1) Configuration
  // ---------------------------------------------------------------------------
  tradecore::EngineConfig config;
  try {
    if (argc > 1) {
      config = tradecore::loadEngineConfig(argv[1]);
      std::cout << "[main] loaded config from " << argv[1] << "\n";
    } else {
      tradecore::validateEngineConfig(config);
      std::cout << "[main] no config file given, using defaults\n";
    }
  } catch (const tradecore::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  tradecore::LiveTimeProvider clock;

  try {
    // -------------------------------------------------------------------------
    // 2) Market data source
    // -------------------------------------------------------------------------
    std::shared_ptr<tradecore::IMarketDataSource> source;
    std::shared_ptr<tradecore::ZmqMarketDataSource> zmq_source;
    if (!config.market_data_endpoint.empty()) {
      zmq_source = std::make_shared<tradecore::ZmqMarketDataSource>(
          config.market_data_endpoint);
      zmq_source->start();
      source = zmq_source;
    } else {
      source = std::make_shared<tradecore::SimulatedMarketDataSource>(
          clock, config.simulated_market);
      std::cout << "[main] using simulated market data (initial price "
                << config.simulated_market.initial_price << ")\n";
    }

    // -------------------------------------------------------------------------
    // 3) Order gateway
    // -------------------------------------------------------------------------
    auto gateway = std::make_shared<tradecore::SimulatedOrderGateway>(
        clock, config.simulated_gateway);
    gateway->start();

    // -------------------------------------------------------------------------
    // 4) Orchestrator
    // -------------------------------------------------------------------------
    tradecore::Orchestrator orchestrator(config, source, gateway, clock);
    subscribeLogging(orchestrator.eventBus());

    std::signal(SIGINT, sigint_handler);

    orchestrator.start();
    std::cout << "[main] running for " << config.run_duration.count()
              << "s. Press Ctrl-C to shut down.\n";

    // -------------------------------------------------------------------------
    // 5) Wait for the run duration or Ctrl-C
    // -------------------------------------------------------------------------
    const auto deadline =
        std::chrono::steady_clock::now() + config.run_duration;
    while (!g_shutdown_requested.load() &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "[main] shutting down...\n";
    orchestrator.stop();
    gateway->stop();
    if (zmq_source) {
      zmq_source->stop();
    }

    for (const auto& position : orchestrator.riskManager().positions()) {
      std::cout << "[main] final position " << position.symbol
                << " qty=" << position.quantity
                << " avg_price=" << position.average_price << "\n";
    }
    std::cout << "[main] daily P&L " << orchestrator.riskManager().dailyPnl()
              << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
