#pragma once

#include "tradecore/domain/market_data.hpp"

#include <optional>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// IMarketDataSource: market data acquisition capability
// -----------------------------------------------------------------------------
//
// @brief  Pull interface polled by the engine's loops.
//
// @details
// getPrice() is called by each symbol's MarketDataIngestor once per ingest
// interval; getOrderBook() by the DecisionLoop once per symbol per decision
// tick. std::nullopt means "nothing new this tick". It is not an error, and
// callers simply try again on their next poll.
//
// Implementations must not block for longer than a poll interval and must
// be safe to call concurrently for different symbols (one ingestor thread
// per symbol plus the decision thread).
//
// healthy() turns false when the source has failed for good (a dead feed
// connection) rather than merely having nothing new. The Orchestrator
// folds it into its own health check.
//
// Ownership:
//   Supplied to the Orchestrator as a shared_ptr and shared with its loops.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual std::optional<domain::PriceSample> getPrice(
      const std::string& symbol) = 0;

  virtual std::optional<domain::OrderBookSnapshot> getOrderBook(
      const std::string& symbol) = 0;

  virtual bool healthy() const { return true; }
};

}  // namespace tradecore
