#pragma once

#include "tradecore/domain/order_status.hpp"
#include "tradecore/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tradecore {
namespace domain {

// Unique order identifier issued by OrderIdGenerator. 0 means "unset".
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  A single order as built by the DecisionLoop and tracked by the
//         OrderCoordinator.
//
// @details
// limit_price must be present iff type == Limit; RiskManager rejects any
// other combination as InvalidOrderType. reference_price is the price the
// decision was made at (the signal's target) and drives the loss-per-trade
// check and the position ledger update.
//
// Value semantics: copies handed to events or callers are snapshots. The
// only mutable copy lives in the OrderCoordinator's pending set.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string strategy;                 // Name of the originating strategy
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  double quantity{0.0};                 // Unsigned size, > 0
  std::optional<double> limit_price;    // Limit orders only
  double reference_price{0.0};
  Timestamp created_at{};
  OrderStatus status{OrderStatus::Created};
};

// Buy → +quantity, Sell → −quantity.
inline double signedQuantity(Side side, double quantity) {
  return side == Side::Buy ? quantity : -quantity;
}

inline const char* toString(Side side) {
  return side == Side::Buy ? "Buy" : "Sell";
}

inline const char* toString(OrderType type) {
  return type == OrderType::Market ? "Market" : "Limit";
}

}  // namespace domain
}  // namespace tradecore
