#pragma once

#include "tradecore/domain/market_data.hpp"
#include "tradecore/domain/trading_signal.hpp"
#include "tradecore/strategy/i_strategy.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// StrategyRegistry
// -----------------------------------------------------------------------------
//
// @brief  Ordered collection of strategies evaluated together.
//
// @details
// evaluate() runs every registered strategy, in registration order, against
// the same window and book and returns every signal produced. Each signal is
// stamped with its strategy's name() so downstream events and orders can be
// traced back to their origin.
//
// Thread model:
//   add() mutates the collection and is only called while the engine is
//   Stopped (the Orchestrator enforces this). evaluate() is const and safe
//   to call concurrently once registration is done.
//
// Ownership:
//   Owns its strategies via unique_ptr.
// -----------------------------------------------------------------------------
class StrategyRegistry {
 public:
  StrategyRegistry() = default;

  StrategyRegistry(const StrategyRegistry&) = delete;
  StrategyRegistry& operator=(const StrategyRegistry&) = delete;

  // Throws std::invalid_argument on a null strategy.
  void add(std::unique_ptr<IStrategy> strategy);

  std::vector<domain::TradingSignal> evaluate(
      const std::vector<domain::PriceSample>& window,
      const domain::OrderBookSnapshot& book) const;

  std::size_t size() const { return strategies_.size(); }
  bool empty() const { return strategies_.empty(); }
  std::vector<std::string> names() const;

 private:
  std::vector<std::unique_ptr<IStrategy>> strategies_;
};

}  // namespace tradecore
