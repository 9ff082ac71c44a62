#pragma once

#include <string>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// Position: net holding for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Signed quantity and volume-weighted average entry price.
//
// @details
// Sign convention for quantity:
//   positive → long
//   negative → short
//   zero     → flat
//
// average_price is only meaningful while quantity != 0. RiskManager resets
// it to 0 when the position nets out and to the fill price when a fill
// carries the position across zero.
//
// realized_pnl accumulates the profit or loss of every reducing fill,
// measured against the average in force before that fill. Unrealized P&L is
// never stored; it is derived from a mark price on demand.
//
// The authoritative copy lives inside RiskManager. Callers get snapshots.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};

  bool isFlat() const { return quantity == 0.0; }

  // quantity * (mark - average_price). Positive when the mark favours the
  // position, for shorts as well as longs.
  double unrealizedPnl(double mark_price) const {
    return quantity * (mark_price - average_price);
  }
};

}  // namespace domain
}  // namespace tradecore
