#pragma once

#include "tradecore/time/time_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// PriceSample
// -----------------------------------------------------------------------------
// One observation of a symbol's last price and traded volume. Produced by an
// IMarketDataSource, validated by the MarketDataIngestor and stored, never
// modified, in the PriceHistoryStore.
// -----------------------------------------------------------------------------
struct PriceSample {
  std::string symbol;
  double price{0.0};     // > 0
  double volume{0.0};    // >= 0
  Timestamp timestamp{};
};

// One rung of an order book side.
struct PriceLevel {
  double price{0.0};
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// OrderBookSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Point-in-time view of the book for one symbol.
//
// @details
// bids are sorted by descending price and asks by ascending price, so the
// best level of each side is at index 0. Strategies receive the snapshot
// alongside the price window; the built-in ones ignore it, but it is part
// of the capability so book-aware strategies can be registered.
// -----------------------------------------------------------------------------
struct OrderBookSnapshot {
  std::string symbol;
  std::vector<PriceLevel> bids;
  std::vector<PriceLevel> asks;
  Timestamp timestamp{};

  std::optional<double> bestBid() const {
    if (bids.empty()) {
      return std::nullopt;
    }
    return bids.front().price;
  }

  std::optional<double> bestAsk() const {
    if (asks.empty()) {
      return std::nullopt;
    }
    return asks.front().price;
  }

  // Midpoint of the touch; empty if either side is empty.
  std::optional<double> mid() const {
    auto bid = bestBid();
    auto ask = bestAsk();
    if (!bid || !ask) {
      return std::nullopt;
    }
    return (*bid + *ask) / 2.0;
  }
};

}  // namespace domain
}  // namespace tradecore
