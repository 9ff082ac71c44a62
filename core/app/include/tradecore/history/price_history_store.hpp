#pragma once

#include "tradecore/domain/market_data.hpp"

#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// PriceHistoryStore: bounded per-symbol price windows
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe map from symbol to the most recent `capacity` price
//         samples, oldest first.
//
// @details
// Writers are the MarketDataIngestor loops (one per symbol). The reader is
// the DecisionLoop, which takes a snapshot per symbol per tick and hands it
// to the strategies.
//
// Window semantics:
//   record() appends and, once a symbol holds more than `capacity` samples,
//   evicts from the front. Samples are kept in arrival order; timestamps are
//   not re-sorted.
//
// Locking:
//   std::shared_mutex. record() holds the exclusive lock only for the append
//   and trim; snapshot() holds the shared lock only while copying. A reader
//   therefore sees either all or none of a concurrent append, never a torn
//   window, and strategies run on their own copy without blocking writers.
//
// Ownership:
//   Owns every stored sample. Held by the Orchestrator through a shared_ptr
//   that each loop also keeps.
// -----------------------------------------------------------------------------
class PriceHistoryStore {
 public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  // Throws std::invalid_argument if capacity is 0.
  explicit PriceHistoryStore(std::size_t capacity = kDefaultCapacity);

  PriceHistoryStore(const PriceHistoryStore&) = delete;
  PriceHistoryStore& operator=(const PriceHistoryStore&) = delete;

  // -------------------------------------------------------------------------
  // record(symbol, sample)
  // -------------------------------------------------------------------------
  // @brief  Appends sample to symbol's window, evicting the oldest sample if
  //         the window exceeds capacity.
  //
  // Thread-safety: Exclusive lock for the duration of the append + trim.
  // -------------------------------------------------------------------------
  void record(const std::string& symbol, domain::PriceSample sample);

  // -------------------------------------------------------------------------
  // snapshot(symbol)
  // -------------------------------------------------------------------------
  // @brief  Copy of symbol's window, oldest first. Empty for an unknown
  //         symbol.
  //
  // Thread-safety: Shared lock while copying.
  // -------------------------------------------------------------------------
  std::vector<domain::PriceSample> snapshot(const std::string& symbol) const;

  std::size_t size(const std::string& symbol) const;

  // Symbols with at least one recorded sample, in no particular order.
  std::vector<std::string> symbols() const;

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::deque<domain::PriceSample>> history_;
};

}  // namespace tradecore
