#pragma once

#include "tradecore/domain/market_data.hpp"
#include "tradecore/domain/trading_signal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// IStrategy: signal generation capability
// -----------------------------------------------------------------------------
//
// @brief  A strategy maps (price window, order book) to at most one signal.
//
// @details
// analyze() is const and implementations hold no mutable state: the
// DecisionLoop may evaluate the same strategy for different symbols
// back-to-back, and a future parallel fan-out must not need locks. All
// tunables are fixed at construction.
//
// The window is oldest-first, as returned by PriceHistoryStore::snapshot().
// The returned signal's `strategy` field may be left empty; the
// StrategyRegistry stamps it with name().
//
// Ownership:
//   Strategies are owned by the StrategyRegistry through unique_ptr.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  // -------------------------------------------------------------------------
  // analyze(window, book)
  // -------------------------------------------------------------------------
  // @param  window  Recent samples for one symbol, oldest first.
  // @param  book    Fresh order book snapshot for the same symbol.
  // @return A signal, or std::nullopt when the strategy has no opinion
  //         (including when the window is too short).
  //
  // Thread-safety: Must be safe to call concurrently.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::TradingSignal> analyze(
      const std::vector<domain::PriceSample>& window,
      const domain::OrderBookSnapshot& book) const = 0;

  virtual std::string name() const = 0;
};

}  // namespace tradecore
