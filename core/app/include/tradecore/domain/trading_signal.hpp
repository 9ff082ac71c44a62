#pragma once

#include "tradecore/domain/order.hpp"

#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// TradingSignal
// -----------------------------------------------------------------------------
// A strategy's recommendation for one symbol. Produced by IStrategy::analyze,
// stamped with the strategy name by the StrategyRegistry and consumed exactly
// once by the DecisionLoop, which turns it into an Order.
// -----------------------------------------------------------------------------
struct TradingSignal {
  std::string strategy;
  std::string symbol;
  Side side{Side::Buy};
  double confidence{0.0};    // In [0, 1]
  double target_price{0.0};  // Becomes the order's reference price
  double quantity{0.0};
};

}  // namespace domain
}  // namespace tradecore
