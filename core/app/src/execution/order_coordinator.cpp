#include "tradecore/execution/order_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tradecore {

namespace {

// Granularity of the bounded wait; the abandon predicate is checked this
// often.
constexpr auto kWaitSlice = std::chrono::milliseconds(10);

bool isReady(const std::future<GatewayAck>& future) {
  return future.valid() && future.wait_for(std::chrono::seconds(0)) ==
                               std::future_status::ready;
}

}  // namespace

const char* toString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::Removed:
      return "Removed";
    case CancelOutcome::NotFound:
      return "NotFound";
    case CancelOutcome::Failed:
      return "Failed";
  }
  return "Unknown";
}

OrderCoordinator::OrderCoordinator(std::shared_ptr<IOrderGateway> gateway,
                                   std::chrono::milliseconds gateway_timeout)
    : gateway_(std::move(gateway)), timeout_(gateway_timeout) {
  if (!gateway_) {
    throw std::invalid_argument("OrderCoordinator requires a gateway");
  }
  if (timeout_.count() <= 0) {
    throw std::invalid_argument(
        "OrderCoordinator gateway timeout must be positive");
  }
}

// -----------------------------------------------------------------------------
// submit(): register as pending, forward, wait for the ack
// -----------------------------------------------------------------------------
SubmitResult OrderCoordinator::submit(const domain::Order& order,
                                      const AbandonPredicate& abandon) {
  SubmitResult result;
  result.order_id = order.id;

  {
    std::lock_guard lock(mutex_);
    if (pending_.count(order.id) > 0 || unresolved_.count(order.id) > 0) {
      result.reason = "duplicate pending order id";
      std::cerr << "[OrderCoordinator] Order " << order.id
                << " not sent: " << result.reason << "\n";
      return result;
    }
    domain::Order pending = order;
    pending.status = domain::OrderStatus::Submitted;
    pending_.emplace(order.id, std::move(pending));
    submitting_.emplace(order.id, std::nullopt);
  }

  std::optional<GatewayAck> ack;
  std::future<GatewayAck> future;
  try {
    future = gateway_->submitOrder(order);
    ack = awaitAck(future, abandon, result.reason);
  } catch (const std::exception& e) {
    result.reason = std::string("gateway error: ") + e.what();
  }

  std::unique_lock lock(mutex_);
  std::optional<domain::OrderStatus> reported;
  auto submitting = submitting_.find(order.id);
  if (submitting != submitting_.end()) {
    reported = submitting->second;
    submitting_.erase(submitting);
  }

  if (ack && ack->accepted) {
    result.accepted = true;
    return result;
  }

  // No ack, but the request is still with the venue.
  if (!ack && future.valid()) {
    if (reported == domain::OrderStatus::Filled) {
      result.accepted = true;
      result.reason.clear();
      std::cout << "[OrderCoordinator] Order " << order.id
                << " filled before its ack arrived\n";
      return result;
    }
    auto it = pending_.find(order.id);
    if (!reported && it != pending_.end()) {
      unresolved_.emplace(order.id,
                          Unresolved{std::move(it->second),
                                     std::move(future), {}});
      pending_.erase(it);
      lock.unlock();

      result.unresolved = true;
      std::cerr << "[OrderCoordinator] Order " << order.id << " ("
                << order.symbol << ") " << result.reason
                << " with the venue outcome unknown. Cancelling.\n";
      cancelUnresolved(order.id);
      return result;
    }
  }

  if (ack) {
    result.reason = ack->message.empty() ? "rejected by gateway"
                                         : ack->message;
  }

  pending_.erase(order.id);
  lock.unlock();
  std::cerr << "[OrderCoordinator] Order " << order.id << " (" << order.symbol
            << ") failed: " << result.reason << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// cancel(): idempotent removal confirmed by the gateway
// -----------------------------------------------------------------------------
CancelResult OrderCoordinator::cancel(domain::OrderId order_id) {
  CancelResult result;

  {
    std::lock_guard lock(mutex_);
    if (pending_.count(order_id) == 0 || cancelling_.count(order_id) > 0) {
      result.outcome = CancelOutcome::NotFound;
      return result;
    }
    cancelling_.insert(order_id);
  }

  std::optional<GatewayAck> ack;
  try {
    std::future<GatewayAck> future = gateway_->cancelOrder(order_id);
    ack = awaitAck(future, {}, result.reason);
  } catch (const std::exception& e) {
    result.reason = std::string("gateway error: ") + e.what();
  }

  std::lock_guard lock(mutex_);
  cancelling_.erase(order_id);

  if (!ack || !ack->accepted) {
    if (ack) {
      result.reason = ack->message.empty() ? "cancel refused by gateway"
                                           : ack->message;
    }
    result.outcome = CancelOutcome::Failed;
    std::cerr << "[OrderCoordinator] Cancel of order " << order_id
              << " failed: " << result.reason << "\n";
    return result;
  }

  // A fill may have completed the order while the cancel was in flight.
  result.outcome = (pending_.erase(order_id) > 0) ? CancelOutcome::Removed
                                                  : CancelOutcome::NotFound;
  return result;
}

// -----------------------------------------------------------------------------
// complete(): apply a terminal execution report
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderCoordinator::complete(
    const ExecutionReport& report) {
  const domain::OrderId order_id = report.order_id;
  const domain::OrderStatus terminal_status = report.status;

  auto legal = [&](const domain::Order& order) {
    if (domain::isTerminal(terminal_status) &&
        domain::canTransition(order.status, terminal_status)) {
      return true;
    }
    std::cerr << "[OrderCoordinator] WARNING: illegal transition for order "
              << order_id << " from " << domain::toString(order.status)
              << " to " << domain::toString(terminal_status)
              << ". Ignoring.\n";
    return false;
  };

  std::lock_guard lock(mutex_);

  auto it = pending_.find(order_id);
  if (it != pending_.end()) {
    domain::Order& order = it->second;
    if (!legal(order)) {
      return std::nullopt;
    }
    order.status = terminal_status;
    domain::Order completed = std::move(order);
    pending_.erase(it);
    cancelling_.erase(order_id);

    auto submitting = submitting_.find(order_id);
    if (submitting != submitting_.end()) {
      submitting->second = terminal_status;
    }
    return completed;
  }

  auto unresolved = unresolved_.find(order_id);
  if (unresolved != unresolved_.end()) {
    if (!legal(unresolved->second.order)) {
      return std::nullopt;
    }
    domain::Order completed = std::move(unresolved->second.order);
    completed.status = terminal_status;
    unresolved_.erase(unresolved);

    std::cerr << "[OrderCoordinator] Late report for unresolved order "
              << order_id << ": " << domain::toString(terminal_status)
              << "\n";
    if (terminal_status == domain::OrderStatus::Filled) {
      LateFill fill;
      fill.order = completed;
      fill.quantity = (report.filled_quantity > 0.0) ? report.filled_quantity
                                                     : completed.quantity;
      fill.price = (report.fill_price > 0.0) ? report.fill_price
                                             : completed.reference_price;
      fill.timestamp = report.timestamp;
      late_fills_.push_back(std::move(fill));
    }
    return completed;
  }

  std::cerr << "[OrderCoordinator] WARNING: report for order " << order_id
            << " which is not pending. Ignoring.\n";
  return std::nullopt;
}

std::optional<domain::Order> OrderCoordinator::complete(
    domain::OrderId order_id, domain::OrderStatus terminal_status) {
  ExecutionReport report;
  report.order_id = order_id;
  report.status = terminal_status;
  return complete(report);
}

// -----------------------------------------------------------------------------
// reconcile(): settle unresolved orders, hand over late fills
// -----------------------------------------------------------------------------
std::vector<LateFill> OrderCoordinator::reconcile() {
  std::lock_guard lock(mutex_);

  for (auto it = unresolved_.begin(); it != unresolved_.end();) {
    if (settledWithoutFill(it->first, it->second)) {
      it = unresolved_.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<LateFill> fills;
  fills.swap(late_fills_);
  return fills;
}

bool OrderCoordinator::isUnresolved(domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  return unresolved_.count(order_id) > 0;
}

// Sorted by id.
std::vector<domain::Order> OrderCoordinator::unresolvedOrders() const {
  std::vector<domain::Order> result;
  {
    std::lock_guard lock(mutex_);
    result.reserve(unresolved_.size());
    for (const auto& [id, entry] : unresolved_) {
      result.push_back(entry.order);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.id < b.id;
            });
  return result;
}

std::size_t OrderCoordinator::unresolvedCount() const {
  std::lock_guard lock(mutex_);
  return unresolved_.size();
}

bool OrderCoordinator::isPending(domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  return pending_.count(order_id) > 0;
}

std::optional<domain::Order> OrderCoordinator::pendingOrder(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(order_id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Sorted by id, so by creation order.
std::vector<domain::Order> OrderCoordinator::pendingOrders() const {
  std::vector<domain::Order> result;
  {
    std::lock_guard lock(mutex_);
    result.reserve(pending_.size());
    for (const auto& [id, order] : pending_) {
      result.push_back(order);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.id < b.id;
            });
  return result;
}

std::size_t OrderCoordinator::pendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

// -----------------------------------------------------------------------------
// awaitAck(): sliced wait on the gateway future
// -----------------------------------------------------------------------------
std::optional<GatewayAck> OrderCoordinator::awaitAck(
    std::future<GatewayAck>& future, const AbandonPredicate& abandon,
    std::string& reason) const {
  if (!future.valid()) {
    reason = "gateway returned an invalid future";
    return std::nullopt;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      if (future.wait_for(std::chrono::seconds(0)) ==
          std::future_status::ready) {
        break;
      }
      reason = "timeout";
      return std::nullopt;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(
        kWaitSlice, deadline - now);
    if (future.wait_for(slice) == std::future_status::ready) {
      break;
    }
    if (abandon && abandon()) {
      reason = "abandoned";
      return std::nullopt;
    }
  }

  try {
    return future.get();
  } catch (const std::exception& e) {
    reason = std::string("gateway error: ") + e.what();
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// cancelUnresolved(): ask the venue to drop an order we stopped waiting for
// -----------------------------------------------------------------------------
void OrderCoordinator::cancelUnresolved(domain::OrderId order_id) {
  std::future<GatewayAck> cancel_ack;
  try {
    cancel_ack = gateway_->cancelOrder(order_id);
  } catch (const std::exception& e) {
    std::cerr << "[OrderCoordinator] Cancel of unresolved order " << order_id
              << " could not be sent: " << e.what() << "\n";
    return;
  }

  std::lock_guard lock(mutex_);
  auto it = unresolved_.find(order_id);
  if (it != unresolved_.end()) {
    it->second.cancel_ack = std::move(cancel_ack);
  }
}

bool OrderCoordinator::settledWithoutFill(domain::OrderId order_id,
                                          Unresolved& entry) {
  if (isReady(entry.submit_ack)) {
    bool accepted = false;
    try {
      accepted = entry.submit_ack.get().accepted;
    } catch (const std::exception& e) {
      std::cerr << "[OrderCoordinator] Late submit ack for order "
                << order_id << " failed: " << e.what() << "\n";
    }
    if (!accepted) {
      std::cout << "[OrderCoordinator] Unresolved order " << order_id
                << " was never taken by the venue\n";
      return true;
    }
  }

  if (isReady(entry.cancel_ack)) {
    bool cancelled = false;
    try {
      cancelled = entry.cancel_ack.get().accepted;
    } catch (const std::exception& e) {
      std::cerr << "[OrderCoordinator] Cancel ack for order " << order_id
                << " failed: " << e.what() << "\n";
    }
    if (cancelled) {
      std::cout << "[OrderCoordinator] Unresolved order " << order_id
                << " cancelled at the venue\n";
      return true;
    }
  }
  return false;
}

}  // namespace tradecore
