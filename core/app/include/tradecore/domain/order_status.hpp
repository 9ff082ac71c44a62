#pragma once

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state an Order can occupy between construction by the
//         DecisionLoop and its final execution report.
//
// @details
// Legal transitions:
//
//   Created ───> Submitted ───> Filled
//      │             │
//      │             ├────────> Cancelled
//      │             │
//      └──> Rejected <┘
//
// Created → Rejected covers risk rejections and gateway failures (the order
// never reached the venue). Filled, Cancelled and Rejected are terminal; the
// OrderCoordinator drops an order from its pending set once it reaches one.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Created,    // Built by the DecisionLoop, not yet sent
  Submitted,  // Acknowledged by the gateway, awaiting execution
  Filled,     // Executed (terminal)
  Cancelled,  // Cancelled on request (terminal)
  Rejected,   // Refused by risk or gateway (terminal)
};

// -----------------------------------------------------------------------------
// canTransition(from, to)
// -----------------------------------------------------------------------------
// @brief  Returns true iff the lifecycle graph above has an edge from → to.
// Thread-safety: Pure function.
// -----------------------------------------------------------------------------
bool canTransition(OrderStatus from, OrderStatus to);

// @brief  True for Filled, Cancelled and Rejected.
bool isTerminal(OrderStatus status);

const char* toString(OrderStatus status);

}  // namespace domain
}  // namespace tradecore
