#include "tradecore/execution/simulated_order_gateway.hpp"

#include "tradecore/time/time_utils.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace tradecore {

namespace {

// How long the worker blocks on an empty queue before re-checking running_.
constexpr auto kIdlePollTimeout = std::chrono::milliseconds(20);

}  // namespace

SimulatedOrderGateway::SimulatedOrderGateway(
    const ITimeProvider& time_provider, SimulatedGatewayConfig config)
    : time_provider_(time_provider), config_(config), rng_(config.seed) {}

SimulatedOrderGateway::~SimulatedOrderGateway() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the worker
// -----------------------------------------------------------------------------
void SimulatedOrderGateway::start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (worker_.joinable()) {
    return;
  }
  running_.store(true);
  worker_ = std::thread([this] { run(); });
  std::cout << "[SimulatedOrderGateway] started (latency="
            << config_.latency.count() << "ms, reject_ratio="
            << config_.reject_ratio << ").\n";
}

// -----------------------------------------------------------------------------
// stop(): join the worker, then fail whatever is still queued
// -----------------------------------------------------------------------------
void SimulatedOrderGateway::stop() {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (!worker_.joinable()) {
      return;
    }
    running_.store(false);
  }

  worker_.join();

  auto leftovers = queue_.drain();
  for (auto& request : leftovers) {
    request.promise.set_value(GatewayAck::fail("gateway stopped"));
  }

  std::cout << "[SimulatedOrderGateway] stopped (" << leftovers.size()
            << " queued requests failed).\n";
}

std::future<GatewayAck> SimulatedOrderGateway::submitOrder(
    const domain::Order& order) {
  submit_count_.fetch_add(1);
  Request request;
  request.kind = Request::Kind::Submit;
  request.order = order;
  return enqueue(std::move(request));
}

std::future<GatewayAck> SimulatedOrderGateway::cancelOrder(
    domain::OrderId order_id) {
  cancel_count_.fetch_add(1);
  Request request;
  request.kind = Request::Kind::Cancel;
  request.cancel_id = order_id;
  return enqueue(std::move(request));
}

void SimulatedOrderGateway::setExecutionReportHandler(
    ExecutionReportHandler handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// enqueue(): hand the request to the worker, or fail it if stopped
// -----------------------------------------------------------------------------
std::future<GatewayAck> SimulatedOrderGateway::enqueue(Request request) {
  std::future<GatewayAck> future = request.promise.get_future();

  std::lock_guard lock(lifecycle_mutex_);
  if (!running_.load()) {
    request.promise.set_value(GatewayAck::fail("gateway not running"));
    return future;
  }
  queue_.push(std::move(request));
  return future;
}

void SimulatedOrderGateway::run() {
  while (running_.load()) {
    std::optional<Request> request = queue_.pop_for(kIdlePollTimeout);
    if (request) {
      process(*request);
    }
  }
}

// -----------------------------------------------------------------------------
// process(): simulate venue latency and outcome for one request
// -----------------------------------------------------------------------------
void SimulatedOrderGateway::process(Request& request) {
  if (config_.latency.count() > 0) {
    std::this_thread::sleep_for(config_.latency);
  }

  if (request.kind == Request::Kind::Cancel) {
    if (live_orders_.erase(request.cancel_id) > 0) {
      request.promise.set_value(GatewayAck::ok());
    } else {
      request.promise.set_value(
          GatewayAck::fail("unknown or already completed order"));
    }
    return;
  }

  const domain::Order& order = request.order;

  if (live_orders_.count(order.id) > 0) {
    request.promise.set_value(GatewayAck::fail("duplicate order id"));
    return;
  }

  if (config_.reject_ratio > 0.0) {
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    if (draw(rng_) < config_.reject_ratio) {
      request.promise.set_value(
          GatewayAck::fail("rejected by simulated venue"));
      return;
    }
  }

  request.promise.set_value(GatewayAck::ok());

  if (!config_.auto_fill) {
    live_orders_.insert(order.id);
    return;
  }

  ExecutionReport fill;
  fill.order_id = order.id;
  fill.status = domain::OrderStatus::Filled;
  fill.filled_quantity = order.quantity;
  fill.fill_price = order.limit_price.value_or(order.reference_price);
  fill.timestamp = ms_to_timestamp(time_provider_.now_ms());
  emitReport(fill);
}

void SimulatedOrderGateway::emitReport(const ExecutionReport& report) {
  std::lock_guard lock(handler_mutex_);
  if (!handler_) {
    return;
  }
  try {
    handler_(report);
  } catch (const std::exception& e) {
    std::cerr << "[SimulatedOrderGateway] report handler failed for order "
              << report.order_id << ": " << e.what() << "\n";
  }
}

}  // namespace tradecore
