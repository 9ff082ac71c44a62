#pragma once

#include "tradecore/concurrent/polling_loop_thread.hpp"
#include "tradecore/history/price_history_store.hpp"
#include "tradecore/market_data/i_market_data_source.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// MarketDataIngestor: one polling loop per symbol
// -----------------------------------------------------------------------------
//
// @brief  Pulls price samples for a single symbol from an IMarketDataSource
//         and records them in the PriceHistoryStore.
//
// @details
// Each ingest tick (pollOnce):
//   - source returns std::nullopt        → counted as a gap, nothing logged
//   - sample for another symbol, price
//     <= 0 or non-finite, volume < 0 or
//     non-finite                         → dropped with a warning
//   - otherwise                          → recorded
//
// Exceptions from the source propagate to the PollingLoopThread, which logs
// them and carries on with the next tick.
//
// Thread model:
//   pollOnce() runs on the ingestor's own loop thread. Counters are atomics
//   and may be read from any thread.
//
// Ownership:
//   Owned by the Orchestrator (unique_ptr). Shares the source and history
//   store through shared_ptr handles and the RunFlag with every other loop.
// -----------------------------------------------------------------------------
class MarketDataIngestor {
 public:
  MarketDataIngestor(std::string symbol,
                     std::shared_ptr<IMarketDataSource> source,
                     std::shared_ptr<PriceHistoryStore> history,
                     std::chrono::milliseconds interval, RunFlag run_flag);

  ~MarketDataIngestor();

  MarketDataIngestor(const MarketDataIngestor&) = delete;
  MarketDataIngestor& operator=(const MarketDataIngestor&) = delete;
  MarketDataIngestor(MarketDataIngestor&&) = delete;
  MarketDataIngestor& operator=(MarketDataIngestor&&) = delete;

  void start();
  void stop();

  // -------------------------------------------------------------------------
  // pollOnce()
  // -------------------------------------------------------------------------
  // @brief  One ingest step. Called by the loop thread; exposed so tests can
  //         drive ingestion deterministically without starting the thread.
  // -------------------------------------------------------------------------
  void pollOnce();

  void setFaultHandler(PollingLoopThread::FaultHandler handler);

  const std::string& symbol() const { return symbol_; }
  LoopStatus status() const { return loop_.status(); }

  std::uint64_t recorded() const { return recorded_.load(); }
  std::uint64_t gaps() const { return gaps_.load(); }
  std::uint64_t dropped() const { return dropped_.load(); }

 private:
  const std::string symbol_;
  std::shared_ptr<IMarketDataSource> source_;
  std::shared_ptr<PriceHistoryStore> history_;

  std::atomic<std::uint64_t> recorded_{0};
  std::atomic<std::uint64_t> gaps_{0};
  std::atomic<std::uint64_t> dropped_{0};

  // Declared last: its thread calls pollOnce(), which uses every member above.
  PollingLoopThread loop_;
};

}  // namespace tradecore
