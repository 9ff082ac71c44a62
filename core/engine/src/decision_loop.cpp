#include "tradecore/engine/decision_loop.hpp"

#include "tradecore/events/event_types.hpp"
#include "tradecore/time/time_utils.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace tradecore {

DecisionLoop::DecisionLoop(std::vector<std::string> symbols,
                           Dependencies deps,
                           std::chrono::milliseconds interval,
                           std::size_t min_samples, RunFlag run_flag)
    : symbols_(std::move(symbols)),
      deps_(std::move(deps)),
      min_samples_(min_samples),
      run_flag_(run_flag),
      loop_("DecisionLoop", interval, [this] { tickOnce(); },
            std::move(run_flag)) {
  if (symbols_.empty()) {
    throw std::invalid_argument("DecisionLoop requires at least one symbol");
  }
  if (min_samples_ == 0) {
    throw std::invalid_argument("DecisionLoop: min_samples must be > 0");
  }
  if (!deps_.history || !deps_.source || deps_.registry == nullptr ||
      deps_.risk == nullptr || deps_.coordinator == nullptr ||
      deps_.bus == nullptr || deps_.ids == nullptr ||
      deps_.clock == nullptr) {
    throw std::invalid_argument("DecisionLoop: missing dependency");
  }
}

DecisionLoop::~DecisionLoop() { stop(); }

void DecisionLoop::start() { loop_.start(); }

void DecisionLoop::stop() { loop_.stop(); }

void DecisionLoop::setFaultHandler(PollingLoopThread::FaultHandler handler) {
  loop_.setFaultHandler(std::move(handler));
}

// -----------------------------------------------------------------------------
// tickOnce(): one pass over every symbol
// -----------------------------------------------------------------------------
void DecisionLoop::tickOnce() {
  reconcileOrders();

  for (const auto& symbol : symbols_) {
    if (stopRequested()) {
      return;
    }

    std::vector<domain::PriceSample> window = deps_.history->snapshot(symbol);
    if (window.size() < min_samples_) {
      continue;
    }

    std::optional<domain::OrderBookSnapshot> book =
        deps_.source->getOrderBook(symbol);
    if (!book) {
      continue;
    }

    for (const auto& signal : deps_.registry->evaluate(window, *book)) {
      if (stopRequested()) {
        return;
      }
      handleSignal(signal);
    }
  }
}

// -----------------------------------------------------------------------------
// reconcileOrders(): late fills into the ledger
// -----------------------------------------------------------------------------
void DecisionLoop::reconcileOrders() {
  for (const auto& fill : deps_.coordinator->reconcile()) {
    const double delta =
        domain::signedQuantity(fill.order.side, fill.quantity);
    domain::Position position;
    try {
      position =
          deps_.risk->updatePosition(fill.order.symbol, delta, fill.price);
    } catch (const std::invalid_argument& e) {
      std::cerr << "[DecisionLoop] late fill for order " << fill.order.id
                << " not booked: " << e.what() << "\n";
      continue;
    }

    late_fills_.fetch_add(1);
    std::cout << "[DecisionLoop] late fill for order " << fill.order.id
              << ": " << domain::toString(fill.order.side) << " "
              << fill.quantity << " " << fill.order.symbol << " @ "
              << fill.price << " booked\n";
    deps_.bus->publish(
        PositionUpdateEvent{fill.order.id, position, fill.timestamp});
  }
}

// -----------------------------------------------------------------------------
// handleSignal(): order construction, risk gate, submission, events
// -----------------------------------------------------------------------------
void DecisionLoop::handleSignal(const domain::TradingSignal& signal) {
  signals_.fetch_add(1);

  const Timestamp now = ms_to_timestamp(deps_.clock->now_ms());

  domain::Order order;
  order.id = deps_.ids->next_id();
  order.strategy = signal.strategy;
  order.symbol = signal.symbol;
  order.side = signal.side;
  order.type = domain::OrderType::Market;
  order.quantity = signal.quantity;
  order.reference_price = signal.target_price;
  order.created_at = now;

  std::cout << "[DecisionLoop] signal from " << signal.strategy << ": "
            << domain::toString(signal.side) << " " << signal.quantity << " "
            << signal.symbol << " @ " << signal.target_price
            << " (confidence " << signal.confidence << ")\n";
  deps_.bus->publish(SignalEvent{signal, now});

  SubmitResult submit_result;
  const RiskManager::CommitResult commit = deps_.risk->validateAndCommit(
      order, signal.target_price, [&](const domain::Order& o) {
        submit_result = deps_.coordinator->submit(
            o, [this] { return stopRequested(); });
        return submit_result.accepted;
      });

  if (!commit.decision.approved) {
    rejected_.fetch_add(1);
    order.status = domain::OrderStatus::Rejected;
    deps_.bus->publish(RiskRejectEvent{order, commit.decision.reason,
                                       commit.decision.detail, now});
    return;
  }

  if (!commit.submitted) {
    failed_.fetch_add(1);
    order.status = domain::OrderStatus::Rejected;
    std::cerr << "[DecisionLoop] order " << order.id << " (" << order.symbol
              << ") not submitted: " << submit_result.reason << "\n";
    deps_.bus->publish(OrderFailedEvent{order, submit_result.reason,
                                        ms_to_timestamp(
                                            deps_.clock->now_ms())});
    return;
  }

  submitted_.fetch_add(1);
  order.status = domain::OrderStatus::Submitted;
  const Timestamp submitted_at = ms_to_timestamp(deps_.clock->now_ms());
  std::cout << "[DecisionLoop] order " << order.id << " submitted\n";
  deps_.bus->publish(OrderSubmittedEvent{
      order, deps_.risk->protectiveLevels(order.side, order.reference_price),
      submitted_at});

  if (commit.position) {
    deps_.bus->publish(
        PositionUpdateEvent{order.id, *commit.position, submitted_at});
  }
}

}  // namespace tradecore
