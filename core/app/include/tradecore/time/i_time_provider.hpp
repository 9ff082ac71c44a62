#pragma once

#include <cstdint>

namespace tradecore {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" so order timestamps can come from the wall clock
//         in production and from a controlled clock in tests.
//
// @details
// The DecisionLoop stamps every Order it builds with now_ms(); the simulated
// market data source stamps its samples the same way. Nothing in the engine
// calls std::chrono::system_clock directly.
//
// Time is exchanged as int64 milliseconds since the Unix epoch, the same
// unit the ZeroMQ tick feed uses. time_utils.hpp converts to Timestamp.
//
// Thread-safety contract:
//   now_ms() is called concurrently from every loop thread. Implementations
//   must be safe for concurrent reads.
//
// Ownership:
//   Borrowed by const reference. The provider must outlive the Orchestrator
//   and every component that reads it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in epoch milliseconds.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradecore
