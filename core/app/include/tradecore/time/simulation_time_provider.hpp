#pragma once

#include "tradecore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradecore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value only changes when the owner sets or
//         advances it.
//
// @details
// Tests inject this provider so order and sample timestamps are
// deterministic. The value is held in a std::atomic<int64_t>: the test thread
// writes while loop threads read, and a lock-free atomic gives the required
// visibility without serializing the readers.
//
// Monotonicity is not enforced. set_time() accepts any value so tests can
// rewind the clock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t initial_ms = 0)
      : current_time_ms_(initial_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time(ms)
  // -------------------------------------------------------------------------
  // @brief  Replaces the current simulated time.
  // Thread-safety: Safe from any thread (atomic store).
  // -------------------------------------------------------------------------
  void set_time(std::int64_t ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms and returns the new value.
  // Thread-safety: Safe from any thread (atomic fetch_add).
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace tradecore
