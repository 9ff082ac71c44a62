#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status.hpp"
#include "tradecore/execution/i_order_gateway.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradecore {

// Outcome of OrderCoordinator::submit().
struct SubmitResult {
  bool accepted{false};
  domain::OrderId order_id{};
  std::string reason;  // Empty when accepted
  // Timed out or abandoned with the request still in flight at the venue.
  // The order is tracked as unresolved until the venue settles it.
  bool unresolved{false};
};

enum class CancelOutcome {
  Removed,   // Gateway confirmed; order left the pending set
  NotFound,  // Not pending (never was, already completed, or cancelled)
  Failed,    // Gateway refused or timed out; order is still pending
};

struct CancelResult {
  CancelOutcome outcome{CancelOutcome::NotFound};
  std::string reason;
};

const char* toString(CancelOutcome outcome);

// A fill reported for an order whose submit() had already given up. The
// venue executed it, so the position ledger still has to record it.
struct LateFill {
  domain::Order order;
  double quantity{0.0};
  double price{0.0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// OrderCoordinator
// -----------------------------------------------------------------------------
//
// @brief  Owns the pending-order set and drives submit/cancel round-trips
//         against an IOrderGateway with a bounded wait.
//
// @details
// Pending set:
//   An order enters on submit() (status Submitted) and leaves when
//     - the gateway refuses it or fails,
//     - the wait for the ack times out or is abandoned (see below),
//     - cancel() is confirmed by the gateway,
//     - complete() records a terminal execution report.
//
// Unresolved orders:
//   A timed-out or abandoned submit leaves the request in flight: the venue
//   can still accept and fill it. Such an order moves to the unresolved set
//   and a cancel is sent. It stays there until one of
//     - the late submit ack is a refusal,
//     - the cancel is confirmed,
//     - an execution report arrives through complete().
//   A Filled report for an unresolved order is queued as a LateFill, and
//   reconcile() hands the queue to the caller for the position ledger. The
//   first two cases are detected by reconcile() as well.
//
// Bounded waits:
//   Gateway futures are waited on in short slices up to `gateway_timeout`.
//   Between slices the optional abandon predicate is consulted, so the
//   DecisionLoop can give up immediately when the engine is stopping instead
//   of sitting out the full timeout.
//
// Locking:
//   One std::mutex over the pending map. It is never held while waiting on
//   the gateway, so execution reports (delivered on the gateway's thread)
//   can call complete() while a submit is in flight.
//
// Ownership:
//   Holds the gateway through a shared_ptr; held itself by the Orchestrator
//   through a shared_ptr shared with the DecisionLoop.
// -----------------------------------------------------------------------------
class OrderCoordinator {
 public:
  // Returns true when the caller wants the current wait abandoned.
  using AbandonPredicate = std::function<bool()>;

  static constexpr std::chrono::milliseconds kDefaultTimeout{500};

  // Throws std::invalid_argument on a null gateway or non-positive timeout.
  OrderCoordinator(std::shared_ptr<IOrderGateway> gateway,
                   std::chrono::milliseconds gateway_timeout = kDefaultTimeout);

  OrderCoordinator(const OrderCoordinator&) = delete;
  OrderCoordinator& operator=(const OrderCoordinator&) = delete;
  OrderCoordinator(OrderCoordinator&&) = delete;
  OrderCoordinator& operator=(OrderCoordinator&&) = delete;

  // -------------------------------------------------------------------------
  // submit(order, abandon)
  // -------------------------------------------------------------------------
  // @brief  Adds order to the pending set and forwards it to the gateway.
  //
  // @return accepted == true if the gateway acknowledged in time; the order
  //         stays pending. Otherwise the order has been removed again and
  //         `reason` says why (gateway message, exception text, "timeout",
  //         "abandoned", "duplicate pending order id"). On "timeout" and
  //         "abandoned" with the request still in flight, `unresolved` is
  //         set and the order is tracked until the venue settles it.
  //
  // A Filled report that arrives before the ack settles the submission as
  // accepted even if the ack itself never comes.
  //
  // Thread-safety: Safe from any thread. Blocks for at most gateway_timeout.
  // -------------------------------------------------------------------------
  SubmitResult submit(const domain::Order& order,
                      const AbandonPredicate& abandon = {});

  // -------------------------------------------------------------------------
  // cancel(order_id)
  // -------------------------------------------------------------------------
  // @brief  Cancels a pending order at the gateway and removes it.
  //
  // @details
  // Unknown ids return NotFound without touching the set or the gateway. A
  // repeated cancel, including one racing an in-flight cancel of the same
  // id, is likewise NotFound.
  // -------------------------------------------------------------------------
  CancelResult cancel(domain::OrderId order_id);

  // -------------------------------------------------------------------------
  // complete(order_id, terminal_status)
  // -------------------------------------------------------------------------
  // @brief  Consumes execution feedback: moves a pending order to a terminal
  //         status and removes it.
  //
  // @return The completed order, or std::nullopt if it was neither pending
  //         nor unresolved, or the transition is not legal (logged).
  //
  // A Filled report for an unresolved order is also queued for reconcile().
  // Missing fill details fall back to the order's quantity and reference
  // price.
  // -------------------------------------------------------------------------
  std::optional<domain::Order> complete(const ExecutionReport& report);
  std::optional<domain::Order> complete(domain::OrderId order_id,
                                        domain::OrderStatus terminal_status);

  // -------------------------------------------------------------------------
  // reconcile()
  // -------------------------------------------------------------------------
  // @brief  Drops unresolved orders the venue has settled without a fill and
  //         returns the late fills queued since the previous call.
  //
  // Thread-safety: Safe from any thread. Never blocks on the gateway.
  // -------------------------------------------------------------------------
  std::vector<LateFill> reconcile();

  bool isPending(domain::OrderId order_id) const;
  std::optional<domain::Order> pendingOrder(domain::OrderId order_id) const;
  std::vector<domain::Order> pendingOrders() const;
  std::size_t pendingCount() const;

  bool isUnresolved(domain::OrderId order_id) const;
  std::vector<domain::Order> unresolvedOrders() const;
  std::size_t unresolvedCount() const;

  std::chrono::milliseconds gatewayTimeout() const { return timeout_; }

 private:
  // Waits on a gateway future. Returns the ack, or std::nullopt with
  // `reason` filled in on timeout, abandonment or an exceptional future.
  std::optional<GatewayAck> awaitAck(std::future<GatewayAck>& future,
                                     const AbandonPredicate& abandon,
                                     std::string& reason) const;

  struct Unresolved {
    domain::Order order;
    std::future<GatewayAck> submit_ack;
    std::future<GatewayAck> cancel_ack;
  };

  // Sends the cancel for an order just moved to the unresolved set.
  void cancelUnresolved(domain::OrderId order_id);

  // True once the venue has refused the submit or confirmed the cancel.
  static bool settledWithoutFill(domain::OrderId order_id,
                                 Unresolved& entry);

  std::shared_ptr<IOrderGateway> gateway_;
  const std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> pending_;
  std::unordered_set<domain::OrderId> cancelling_;
  // Orders inside submit(), with the terminal status reported while the
  // ack was awaited, if any.
  std::unordered_map<domain::OrderId, std::optional<domain::OrderStatus>>
      submitting_;
  std::unordered_map<domain::OrderId, Unresolved> unresolved_;
  std::vector<LateFill> late_fills_;
};

}  // namespace tradecore
