#pragma once

#include "tradecore/domain/order.hpp"

#include <atomic>

namespace tradecore {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, increasing OrderIds starting at 1.
//
// @details
// Owned by the Orchestrator and shared with the DecisionLoop. IDs stay
// unique across restarts of the same Orchestrator because the counter is
// never reset, which keeps late execution reports from an earlier run from
// matching a new order.
//
// Relaxed ordering is enough: the only guarantee needed is that no two calls
// return the same value.
//
// Thread-safety: next_id() is safe to call concurrently.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace tradecore
