#pragma once

#include "tradecore/domain/market_data.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace tradecore {

// A decoded feed message: either a trade/price tick or a book snapshot.
using MarketDataMessage =
    std::variant<domain::PriceSample, domain::OrderBookSnapshot>;

// Thrown by decodeMarketDataMessage() for payloads it cannot use.
class MarketDataDecodeError : public std::runtime_error {
 public:
  explicit MarketDataDecodeError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// decodeMarketDataMessage(payload)
// -----------------------------------------------------------------------------
//
// @brief  Parses one JSON message from the ZeroMQ market data feed.
//
// @details
// Accepted shapes ("type" defaults to "price"):
//
//   {"type": "price", "symbol": "BTC/USD", "price": 101.5,
//    "volume": 2500.0, "timestamp_ms": 1700000000000}
//
//   {"type": "book", "symbol": "BTC/USD",
//    "bids": [[101.4, 3.0], [101.3, 5.0]],
//    "asks": [[101.6, 2.0]],
//    "timestamp_ms": 1700000000000}
//
// "volume" defaults to 0. Bids are re-sorted descending and asks ascending.
// Throws MarketDataDecodeError on malformed JSON, missing or mistyped
// fields, an unknown type, an empty symbol, or a non-positive price.
// -----------------------------------------------------------------------------
MarketDataMessage decodeMarketDataMessage(const std::string& payload);

}  // namespace tradecore
